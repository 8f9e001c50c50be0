#pragma once

#include "engine/Margins.hpp"
#include "engine/StyleProfiles.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace folio::engine {

// A4 print stylesheet scaled by the profile, @page margins in centimetres.
std::string print_stylesheet(StyleProfile const &profile,
                             PageMargins const &margins);

// Wraps the body of the externalizer's HTML in the print document.
std::string apply_html_template(std::string_view externalized_html,
                                StyleProfile const &profile,
                                PageMargins const &margins,
                                std::string_view title);

// Inner markup of <body>, or the input when there is no body element.
std::string_view extract_body(std::string_view html);

std::string_view paperwhite_stylesheet() noexcept;

struct HtmlBundle {
  std::filesystem::path html_path;
  std::size_t assets = 0;
};

// Writes <bundle_dir>/<stem>.html with absolute file references copied into
// <bundle_dir>/assets and rewritten relative.
std::optional<HtmlBundle> save_html_bundle(std::string_view html,
                                           std::filesystem::path const &bundle_dir,
                                           std::string_view stem);

} // namespace folio::engine
