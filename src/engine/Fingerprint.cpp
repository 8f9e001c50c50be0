#include "engine/Fingerprint.hpp"

#include "utils/Digest.hpp"

#include <format>

namespace folio::engine
{

namespace
{

constexpr std::string_view kFingerprintVersion = "folio-fingerprint/1;";

void append_field(std::string &out, std::string_view name,
                  std::string_view value)
{
    out += std::format("{}={}:{};", name, value.size(), value);
}

} // namespace

FingerprintInputs fingerprint_inputs(ConversionSettings const &settings)
{
    FingerprintInputs inputs;
    inputs.profile = settings.profile;
    inputs.max_width = settings.max_width;
    inputs.max_height = settings.max_height;
    if (settings.format == OutputFormat::Pdf)
    {
        inputs.margins = settings.margins;
        inputs.page_breaks = true;
    }
    return inputs;
}

std::string canonical_fingerprint_text(FingerprintInputs const &inputs)
{
    std::string out(kFingerprintVersion);
    append_field(out, "profile", inputs.profile);
    append_field(out, "max_width", dimension_tag(inputs.max_width));
    append_field(out, "max_height", dimension_tag(inputs.max_height));
    append_field(out, "margins", inputs.margins.value_or(std::string{}));
    append_field(out, "page_breaks", inputs.page_breaks ? "1" : "0");
    return out;
}

std::string configuration_fingerprint(FingerprintInputs const &inputs)
{
    return folio::utils::sha256_bytes(canonical_fingerprint_text(inputs));
}

} // namespace folio::engine
