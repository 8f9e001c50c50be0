#include "engine/Margins.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace folio::engine
{

namespace
{

struct UnitSuffix
{
    std::string_view suffix;
    MarginUnit unit;
};

constexpr std::array<UnitSuffix, 5> kUnits = {{
    {"cm", MarginUnit::Centimetres},
    {"in", MarginUnit::Inches},
    {"mm", MarginUnit::Millimetres},
    {"pt", MarginUnit::Points},
    {"px", MarginUnit::Pixels},
}};

std::vector<std::string_view> split_whitespace(std::string_view text)
{
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() &&
               std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
        auto start = pos;
        while (pos < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
        if (pos > start)
        {
            parts.push_back(text.substr(start, pos - start));
        }
    }
    return parts;
}

} // namespace

double MarginValue::to_inches() const noexcept
{
    switch (unit)
    {
    case MarginUnit::Centimetres:
        return value / 2.54;
    case MarginUnit::Millimetres:
        return value / 25.4;
    case MarginUnit::Points:
        return value / 72.0;
    case MarginUnit::Pixels:
        return value / 96.0;
    case MarginUnit::Inches:
        break;
    }
    return value;
}

double MarginValue::to_cm() const noexcept
{
    switch (unit)
    {
    case MarginUnit::Centimetres:
        return value;
    case MarginUnit::Millimetres:
        return value / 10.0;
    case MarginUnit::Points:
        return value * 0.0352778;
    case MarginUnit::Pixels:
        return value * 0.0264583;
    case MarginUnit::Inches:
        break;
    }
    return value * 2.54;
}

std::optional<MarginValue> parse_margin_value(std::string_view token,
                                              std::string &error)
{
    MarginValue parsed;
    auto number = token;
    for (auto const &candidate : kUnits)
    {
        if (token.size() > candidate.suffix.size() &&
            token.ends_with(candidate.suffix))
        {
            number = token.substr(0, token.size() - candidate.suffix.size());
            parsed.unit = candidate.unit;
            break;
        }
    }
    auto [ptr, ec] = std::from_chars(number.data(),
                                     number.data() + number.size(),
                                     parsed.value);
    if (ec != std::errc{} || ptr != number.data() + number.size() ||
        !std::isfinite(parsed.value))
    {
        error = std::format("invalid margin '{}': use a value like 1in, "
                            "2.5cm or 10mm",
                            token);
        return std::nullopt;
    }
    auto inches = parsed.to_inches();
    if (inches < 0.0)
    {
        error = std::format("margin '{}' is negative; the minimum is 0",
                            token);
        return std::nullopt;
    }
    if (inches > kMaxMarginInches)
    {
        error = std::format("margin '{}' is too large; the maximum is 3in "
                            "(7.62cm)",
                            token);
        return std::nullopt;
    }
    return parsed;
}

std::optional<PageMargins> parse_margins(std::string_view spec,
                                         std::string &error)
{
    auto parts = split_whitespace(spec);
    std::vector<MarginValue> values;
    values.reserve(parts.size());
    if (parts.size() != 1 && parts.size() != 2 && parts.size() != 4)
    {
        error = std::format("invalid margins '{}': use 1, 2 or 4 values",
                            spec);
        return std::nullopt;
    }
    for (auto part : parts)
    {
        auto value = parse_margin_value(part, error);
        if (!value)
        {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    if (values.size() == 1)
    {
        return PageMargins{values[0], values[0], values[0], values[0]};
    }
    if (values.size() == 2)
    {
        return PageMargins{values[0], values[1], values[0], values[1]};
    }
    return PageMargins{values[0], values[1], values[2], values[3]};
}

std::string margin_css_cm(MarginValue const &value)
{
    return std::format("{}cm", value.to_cm());
}

} // namespace folio::engine
