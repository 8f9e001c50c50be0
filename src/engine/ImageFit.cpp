#include "engine/ImageFit.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace folio::engine
{

namespace
{

constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G',
                                                       0x0D, 0x0A, 0x1A, 0x0A};

std::uint32_t read_be32(std::span<std::uint8_t const> bytes,
                        std::size_t offset)
{
    return (static_cast<std::uint32_t>(bytes[offset]) << 24) |
           (static_cast<std::uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(bytes[offset + 2]) << 8) |
           static_cast<std::uint32_t>(bytes[offset + 3]);
}

std::uint32_t scaled(std::uint32_t value, double factor)
{
    return clamp_pixels(std::floor(static_cast<double>(value) * factor));
}

} // namespace

std::optional<ImageSize> read_png_size(std::span<std::uint8_t const> bytes)
{
    // signature, IHDR length, "IHDR", width, height
    if (bytes.size() < 24 ||
        !std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin()))
    {
        return std::nullopt;
    }
    if (bytes[12] != 'I' || bytes[13] != 'H' || bytes[14] != 'D' ||
        bytes[15] != 'R')
    {
        return std::nullopt;
    }
    ImageSize size{read_be32(bytes, 16), read_be32(bytes, 20)};
    if (size.width == 0 || size.height == 0)
    {
        return std::nullopt;
    }
    return size;
}

ImageSize fit_display_size(ImageSize raster, RenderDirective const &directive,
                           std::uint32_t page_width, Dimension const &max_width,
                           Dimension const &max_height)
{
    if (directive.no_resize || raster.width == 0 || raster.height == 0)
    {
        return raster;
    }
    auto target_width = clamp_pixels(static_cast<double>(page_width) *
                                     directive.scale_percent / 100.0);
    double fit = static_cast<double>(target_width) /
                 static_cast<double>(raster.width);
    ImageSize fitted{target_width, scaled(raster.height, fit)};

    auto width_bound = resolve_dimension(max_width, fitted.width);
    auto height_bound = resolve_dimension(max_height, fitted.height);
    if (!width_bound && !height_bound)
    {
        return fitted;
    }
    double factor = 1.0;
    if (width_bound && height_bound)
    {
        factor = std::min(static_cast<double>(*width_bound) / fitted.width,
                          static_cast<double>(*height_bound) / fitted.height);
    }
    else if (width_bound)
    {
        factor = static_cast<double>(*width_bound) / fitted.width;
    }
    else
    {
        factor = static_cast<double>(*height_bound) / fitted.height;
    }
    if (factor == 1.0)
    {
        return fitted;
    }
    ImageSize capped{scaled(fitted.width, factor),
                     scaled(fitted.height, factor)};
    FOLIO_LOG_DEBUG("diagram display {}x{} capped to {}x{}", fitted.width,
                    fitted.height, capped.width, capped.height);
    return capped;
}

} // namespace folio::engine
