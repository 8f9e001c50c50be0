#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace folio::engine {

enum class MarginUnit { Inches, Centimetres, Millimetres, Points, Pixels };

struct MarginValue {
  double value = 0.0;
  MarginUnit unit = MarginUnit::Inches;

  double to_inches() const noexcept;
  double to_cm() const noexcept;
};

struct PageMargins {
  MarginValue top;
  MarginValue right;
  MarginValue bottom;
  MarginValue left;
};

inline constexpr char const kDefaultMargins[] = "1in 0.75in";
inline constexpr double kMaxMarginInches = 3.0;

// One value ("1in"), two (vertical horizontal) or four (top right bottom
// left), CSS order. A bare number is inches. Each value must lie in
// [0, 3] inches. On failure `error` carries a user-facing reason.
std::optional<PageMargins> parse_margins(std::string_view spec,
                                         std::string &error);
std::optional<MarginValue> parse_margin_value(std::string_view token,
                                              std::string &error);

// "<n>cm" rendering for CSS @page rules and print options.
std::string margin_css_cm(MarginValue const &value);

} // namespace folio::engine
