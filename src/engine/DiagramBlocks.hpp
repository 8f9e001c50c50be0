#pragma once

#include "engine/RenderResult.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::engine {

// A fenced ```mermaid / ```plantuml region, including the sizing comment on
// the line above it when there is one.
struct DiagramBlock {
  DiagramDialect dialect = DiagramDialect::Mermaid;
  std::size_t begin = 0;
  std::size_t end = 0;
  std::string source;
  RenderDirective directive;
};

std::vector<DiagramBlock> find_diagram_blocks(std::string_view markdown);

inline constexpr unsigned kMaxScalePercent = 1000;

// "<!-- no-resize -->" or "<!-- scale:N% -->"; nullopt for other text.
// Scales outside 1..kMaxScalePercent are reported and fall back to 100%.
std::optional<RenderDirective> parse_directive_comment(std::string_view line);

// Replaces each block's byte range with the matching replacement text.
std::string replace_blocks(std::string_view markdown,
                           std::vector<DiagramBlock> const &blocks,
                           std::vector<std::string> const &replacements);

std::string_view dialect_name(DiagramDialect dialect) noexcept;

} // namespace folio::engine
