#include "engine/Dimension.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <type_traits>

namespace folio::engine
{

namespace
{

std::string_view trim(std::string_view text)
{
    while (!text.empty() &&
           (text.front() == ' ' || text.front() == '\t'))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
    {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

std::uint32_t clamp_pixels(double value) noexcept
{
    if (!(value >= 1.0))
    {
        return 1;
    }
    if (value >= static_cast<double>(kMaxDimensionPx))
    {
        return kMaxDimensionPx;
    }
    return static_cast<std::uint32_t>(value);
}

std::optional<Dimension> parse_dimension(std::string_view text)
{
    text = trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }
    if (text.back() == '%')
    {
        auto number = trim(text.substr(0, text.size() - 1));
        double percent = 0.0;
        auto [ptr, ec] = std::from_chars(
            number.data(), number.data() + number.size(), percent);
        if (ec != std::errc{} || ptr != number.data() + number.size() ||
            !std::isfinite(percent) || percent <= 0.0 ||
            percent > kMaxDimensionPercent)
        {
            return std::nullopt;
        }
        return Dimension{PercentOf{percent}};
    }
    std::uint32_t pixels = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), pixels);
    if (ec != std::errc{} || ptr != text.data() + text.size() || pixels == 0 ||
        pixels > kMaxDimensionPx)
    {
        return std::nullopt;
    }
    return Dimension{Pixels{pixels}};
}

std::optional<std::uint32_t> resolve_dimension(Dimension const &dimension,
                                               std::uint32_t original)
{
    return std::visit(
        [original](auto const &bound) -> std::optional<std::uint32_t>
        {
            using Bound = std::decay_t<decltype(bound)>;
            if constexpr (std::is_same_v<Bound, Pixels>)
            {
                if (original > bound.value)
                {
                    return bound.value;
                }
                return std::nullopt;
            }
            else
            {
                return clamp_pixels(static_cast<double>(original) *
                                    bound.percent / 100.0);
            }
        },
        dimension);
}

std::string dimension_tag(Dimension const &dimension)
{
    if (auto const *pixels = std::get_if<Pixels>(&dimension))
    {
        return std::format("px:{}", pixels->value);
    }
    return std::format("pct:{}", std::get<PercentOf>(dimension).percent);
}

std::string dimension_to_string(Dimension const &dimension)
{
    if (auto const *pixels = std::get_if<Pixels>(&dimension))
    {
        return std::format("{}", pixels->value);
    }
    return std::format("{}%", std::get<PercentOf>(dimension).percent);
}

std::uint32_t page_width_px(Dimension const &width)
{
    if (auto const *pixels = std::get_if<Pixels>(&width))
    {
        return pixels->value;
    }
    return kDefaultPageWidthPx;
}

std::pair<std::uint32_t, std::uint32_t>
diagram_viewport(Dimension const &width, Dimension const &height)
{
    std::uint32_t viewport_width = kDefaultPageWidthPx * 2;
    std::uint32_t viewport_height = kDefaultPageHeightPx * 2;
    if (auto const *pixels = std::get_if<Pixels>(&width))
    {
        viewport_width = std::min(pixels->value, kMaxDimensionPx) * 2;
    }
    if (auto const *pixels = std::get_if<Pixels>(&height))
    {
        viewport_height = std::min(pixels->value, kMaxDimensionPx) * 2;
    }
    return {viewport_width, viewport_height};
}

} // namespace folio::engine
