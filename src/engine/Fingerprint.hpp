#pragma once

#include "engine/ConversionSettings.hpp"
#include "engine/Dimension.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace folio::engine {

// Everything that changes the produced artifact apart from the source bytes.
struct FingerprintInputs {
  std::string profile;
  Dimension max_width = Pixels{kDefaultPageWidthPx};
  Dimension max_height = Pixels{kDefaultPageHeightPx};
  // Absent for e-reader outputs.
  std::optional<std::string> margins;
  bool page_breaks = false;
};

FingerprintInputs fingerprint_inputs(ConversionSettings const &settings);

// Length-prefixed, versioned serialization; exposed for tests.
std::string canonical_fingerprint_text(FingerprintInputs const &inputs);
std::string configuration_fingerprint(FingerprintInputs const &inputs);

} // namespace folio::engine
