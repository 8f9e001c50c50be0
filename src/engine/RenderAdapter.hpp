#pragma once

#include "engine/RenderResult.hpp"

#include <filesystem>
#include <string>

namespace folio::engine {

// Turns one diagram source into a raster file. Never throws; every failure
// is an explicit RenderResult.
class RenderAdapter {
public:
  virtual ~RenderAdapter() = default;
  virtual RenderResult render(std::string const &source,
                              std::filesystem::path const &output_path,
                              RenderDirective const &directive) = 0;
};

} // namespace folio::engine
