#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace folio::engine {

enum class RenderStatus { Success, RetryableError, FatalError };

struct ImageSize {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

struct RenderResult {
  RenderStatus status = RenderStatus::FatalError;
  std::string message;
  // Pixel size of the written raster.
  ImageSize raster;
  // Size the document should display the raster at.
  ImageSize display;

  bool ok() const noexcept { return status == RenderStatus::Success; }

  static RenderResult success(ImageSize raster, ImageSize display) {
    return RenderResult{RenderStatus::Success, {}, raster, display};
  }
  static RenderResult retryable(std::string message) {
    return RenderResult{RenderStatus::RetryableError, std::move(message), {},
                        {}};
  }
  static RenderResult fatal(std::string message) {
    return RenderResult{RenderStatus::FatalError, std::move(message), {}, {}};
  }
};

// Sizing directive from the HTML comment preceding a diagram fence.
struct RenderDirective {
  bool no_resize = false;
  double scale_percent = 100.0;
};

enum class DiagramDialect { Mermaid, PlantUml };

} // namespace folio::engine
