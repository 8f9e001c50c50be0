#include "engine/StyleProfiles.hpp"

#include <array>

namespace folio::engine
{

namespace
{

constexpr std::array<StyleProfile, 5> kProfiles = {{
    {"a4-print", "A4 Print", "print layout with a 12px base font", 1.0,
     "12px", true, false},
    {"a4-screen", "A4 Screen", "screen layout with 30% larger fonts", 1.3,
     "15.6px", true, false},
    {"kindle-basic", "Kindle Basic", "plain e-ink formatting", 1.0, "12px",
     false, true},
    {"kindle-large", "Kindle Large Text", "larger text for e-readers", 1.2,
     "14px", false, true},
    {"kindle-paperwhite-11", "Kindle Paperwhite 11th Gen",
     "tuned for the 6.8\" 300ppi Paperwhite display", 1.1, "13px", false,
     true},
}};

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view text)
{
    if (text == "pdf")
    {
        return OutputFormat::Pdf;
    }
    if (text == "epub")
    {
        return OutputFormat::Epub;
    }
    if (text == "mobi")
    {
        return OutputFormat::Mobi;
    }
    return std::nullopt;
}

std::string_view format_name(OutputFormat format) noexcept
{
    switch (format)
    {
    case OutputFormat::Epub:
        return "epub";
    case OutputFormat::Mobi:
        return "mobi";
    case OutputFormat::Pdf:
        break;
    }
    return "pdf";
}

std::span<StyleProfile const> style_profiles() noexcept
{
    return kProfiles;
}

StyleProfile const *find_style_profile(std::string_view id) noexcept
{
    for (auto const &profile : kProfiles)
    {
        if (profile.id == id)
        {
            return &profile;
        }
    }
    return nullptr;
}

std::string_view default_profile_for(OutputFormat format) noexcept
{
    return format == OutputFormat::Pdf ? "a4-print" : "kindle-basic";
}

} // namespace folio::engine
