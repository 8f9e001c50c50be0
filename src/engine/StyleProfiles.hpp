#pragma once

#include <optional>
#include <span>
#include <string_view>

namespace folio::engine {

enum class OutputFormat { Pdf, Epub, Mobi };

std::optional<OutputFormat> parse_output_format(std::string_view text);
std::string_view format_name(OutputFormat format) noexcept;

struct StyleProfile {
  std::string_view id;
  std::string_view name;
  std::string_view description;
  double font_scale = 1.0;
  std::string_view base_font_size;
  bool pdf = false;
  bool ebook = false;

  bool supports(OutputFormat format) const noexcept {
    return format == OutputFormat::Pdf ? pdf : ebook;
  }
};

std::span<StyleProfile const> style_profiles() noexcept;
StyleProfile const *find_style_profile(std::string_view id) noexcept;
std::string_view default_profile_for(OutputFormat format) noexcept;

} // namespace folio::engine
