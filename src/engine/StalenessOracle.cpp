#include "engine/StalenessOracle.hpp"

namespace folio::engine
{

StalenessReason
staleness_reason(std::optional<folio::storage::DocumentRecord> const &record,
                 std::string_view current_source_digest, bool artifact_exists,
                 std::string_view current_fingerprint, bool force)
{
    if (force)
    {
        return StalenessReason::Forced;
    }
    if (!record)
    {
        return StalenessReason::NoRecord;
    }
    // Existence first: bookkeeping about a file that is gone proves nothing.
    if (!artifact_exists)
    {
        return StalenessReason::ArtifactMissing;
    }
    if (record->source_digest != current_source_digest)
    {
        return StalenessReason::SourceChanged;
    }
    if (record->fingerprint != current_fingerprint)
    {
        return StalenessReason::ConfigurationChanged;
    }
    return StalenessReason::UpToDate;
}

bool needs_regeneration(
    std::optional<folio::storage::DocumentRecord> const &record,
    std::string_view current_source_digest, bool artifact_exists,
    std::string_view current_fingerprint, bool force)
{
    return staleness_reason(record, current_source_digest, artifact_exists,
                            current_fingerprint, force) !=
           StalenessReason::UpToDate;
}

std::string_view describe(StalenessReason reason) noexcept
{
    switch (reason)
    {
    case StalenessReason::UpToDate:
        return "up to date";
    case StalenessReason::Forced:
        return "forced";
    case StalenessReason::NoRecord:
        return "never converted";
    case StalenessReason::ArtifactMissing:
        return "artifact missing";
    case StalenessReason::SourceChanged:
        return "source changed";
    case StalenessReason::ConfigurationChanged:
        return "configuration changed";
    }
    return "unknown";
}

} // namespace folio::engine
