#pragma once

#include "utils/StateStore.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace folio::engine {

enum class StalenessReason {
  UpToDate,
  Forced,
  NoRecord,
  ArtifactMissing,
  SourceChanged,
  ConfigurationChanged,
};

StalenessReason
staleness_reason(std::optional<folio::storage::DocumentRecord> const &record,
                 std::string_view current_source_digest, bool artifact_exists,
                 std::string_view current_fingerprint, bool force);

// True when the document must be converted again.
bool needs_regeneration(
    std::optional<folio::storage::DocumentRecord> const &record,
    std::string_view current_source_digest, bool artifact_exists,
    std::string_view current_fingerprint, bool force);

std::string_view describe(StalenessReason reason) noexcept;

} // namespace folio::engine
