#pragma once

#include "engine/Dimension.hpp"
#include "engine/RenderResult.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace folio::engine {

// Width and height from the IHDR chunk; nullopt for anything but a PNG.
std::optional<ImageSize> read_png_size(std::span<std::uint8_t const> bytes);

// Display size for a rendered diagram: width fitted to the directive's share
// of the page width, then capped by the max dimensions. `no-resize` keeps the
// raster size untouched.
ImageSize fit_display_size(ImageSize raster, RenderDirective const &directive,
                           std::uint32_t page_width, Dimension const &max_width,
                           Dimension const &max_height);

} // namespace folio::engine
