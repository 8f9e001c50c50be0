#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace folio::engine {

inline constexpr char const kPageBreakDiv[] = "<div class=\"page-break\"></div>";

// Drops "## Table of contents" / "### Table of contents" sections up to the
// next level 1-3 heading and collapses the blank lines left behind.
std::string filter_print_sections(std::string_view markdown);

// Rewrites every page-break marker to kPageBreakDiv when `keep` is set,
// removes them otherwise (e-reader outputs).
std::string process_page_breaks(std::string_view markdown, bool keep);

// First ATX H1, else first Setext H1, else the humanized filename stem.
std::string extract_title(std::string_view markdown,
                          std::filesystem::path const &source);
std::string humanize_stem(std::string_view stem);

struct EmbeddedImage {
  std::string reference;
  std::filesystem::path copied_to;
};

struct EmbedResult {
  std::string markdown;
  std::vector<EmbeddedImage> embedded;
  std::size_t missing = 0;
};

// Copies local images referenced by Markdown `![..](..)` or `<img src>` into
// `temp_dir` and points the references at the copies. Remote, data: and
// already-temporary references are left untouched.
EmbedResult embed_local_images(std::string_view markdown,
                               std::filesystem::path const &source_dir,
                               std::filesystem::path const &temp_dir);

} // namespace folio::engine
