#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace folio::engine {

// Upper bound in pixels; only applied when the original exceeds it.
struct Pixels {
  std::uint32_t value = 0;
};

// Always applied, relative to the original size.
struct PercentOf {
  double percent = 100.0;
};

using Dimension = std::variant<Pixels, PercentOf>;

inline constexpr std::uint32_t kDefaultPageWidthPx = 1680;
inline constexpr std::uint32_t kDefaultPageHeightPx = 2240;
inline constexpr std::uint32_t kMaxDimensionPx = 32768;
inline constexpr double kMaxDimensionPercent = 1000.0;

// Rounds a computed side length down to whole pixels within
// [1, kMaxDimensionPx]. NaN maps to 1.
std::uint32_t clamp_pixels(double value) noexcept;

// Accepts "1680" or "80%". Zero, negative, malformed and oversized values
// (above kMaxDimensionPx or kMaxDimensionPercent) are rejected.
std::optional<Dimension> parse_dimension(std::string_view text);

// Target size for an image whose side is `original` pixels, or nullopt when
// the original already satisfies the constraint.
std::optional<std::uint32_t> resolve_dimension(Dimension const &dimension,
                                               std::uint32_t original);

// "px:<n>" or "pct:<value>", used by the configuration fingerprint.
std::string dimension_tag(Dimension const &dimension);
// Round-trips through parse_dimension.
std::string dimension_to_string(Dimension const &dimension);

// Page content width diagrams are fitted to: the pixel bound, or the
// default when the bound is a percentage.
std::uint32_t page_width_px(Dimension const &width);

// Browser viewport used while laying out a diagram: twice the pixel bounds,
// 3360x4480 for percentage bounds.
std::pair<std::uint32_t, std::uint32_t>
diagram_viewport(Dimension const &width, Dimension const &height);

} // namespace folio::engine
