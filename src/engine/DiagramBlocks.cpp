#include "engine/DiagramBlocks.hpp"

#include "utils/Log.hpp"

#include <cctype>
#include <charconv>

namespace folio::engine
{

namespace
{

constexpr std::string_view kFence = "```";

bool iequals_prefix(std::string_view text, std::string_view prefix)
{
    if (text.size() < prefix.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
        {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

// Length of the line break at `pos` ("\n" or "\r\n"), 0 if none.
std::size_t newline_at(std::string_view text, std::size_t pos)
{
    if (pos < text.size() && text[pos] == '\n')
    {
        return 1;
    }
    if (pos + 1 < text.size() && text[pos] == '\r' && text[pos + 1] == '\n')
    {
        return 2;
    }
    return 0;
}

std::optional<DiagramDialect> fence_dialect(std::string_view info,
                                            std::size_t &consumed)
{
    if (iequals_prefix(info, "mermaid"))
    {
        consumed = 7;
        return DiagramDialect::Mermaid;
    }
    if (iequals_prefix(info, "plantuml"))
    {
        consumed = 8;
        return DiagramDialect::PlantUml;
    }
    return std::nullopt;
}

// Start of the directive comment on the line before `fence_start`, if any.
std::optional<std::size_t> directive_start(std::string_view markdown,
                                           std::size_t fence_start,
                                           RenderDirective &directive)
{
    if (fence_start == 0)
    {
        return std::nullopt;
    }
    auto line_end = fence_start - 1; // the '\n' before the fence
    if (markdown[line_end] != '\n')
    {
        return std::nullopt;
    }
    auto previous_break = line_end == 0
                              ? std::string_view::npos
                              : markdown.rfind('\n', line_end - 1);
    auto line_begin =
        previous_break == std::string_view::npos ? 0 : previous_break + 1;
    auto line = markdown.substr(line_begin, line_end - line_begin);
    auto parsed = parse_directive_comment(line);
    if (!parsed)
    {
        return std::nullopt;
    }
    directive = *parsed;
    return line_begin;
}

} // namespace

std::string_view dialect_name(DiagramDialect dialect) noexcept
{
    return dialect == DiagramDialect::Mermaid ? "Mermaid" : "PlantUML";
}

std::optional<RenderDirective> parse_directive_comment(std::string_view line)
{
    line = trim(line);
    if (!line.starts_with("<!--") || !line.ends_with("-->"))
    {
        return std::nullopt;
    }
    auto body = trim(line.substr(4, line.size() - 7));
    RenderDirective directive;
    if (iequals_prefix(body, "no-resize") && body.size() == 9)
    {
        directive.no_resize = true;
        return directive;
    }
    if (!iequals_prefix(body, "scale:") || !body.ends_with('%'))
    {
        return std::nullopt;
    }
    auto digits = body.substr(6, body.size() - 7);
    unsigned percent = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), percent);
    if (ptr != digits.data() + digits.size() ||
        (ec != std::errc{} && ec != std::errc::result_out_of_range) ||
        digits.empty())
    {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range || percent == 0 ||
        percent > kMaxScalePercent)
    {
        FOLIO_LOG_WARN("scale {}% is outside 1%..{}%; using 100%", digits,
                       kMaxScalePercent);
        return directive;
    }
    directive.scale_percent = static_cast<double>(percent);
    return directive;
}

std::vector<DiagramBlock> find_diagram_blocks(std::string_view markdown)
{
    std::vector<DiagramBlock> blocks;
    std::size_t pos = 0;
    while (pos < markdown.size())
    {
        auto fence = markdown.find(kFence, pos);
        if (fence == std::string_view::npos)
        {
            break;
        }
        bool at_line_start = fence == 0 || markdown[fence - 1] == '\n';
        std::size_t consumed = 0;
        auto dialect = at_line_start
                           ? fence_dialect(markdown.substr(fence + 3), consumed)
                           : std::nullopt;
        auto info_end = fence + 3 + consumed;
        auto opening_break = dialect ? newline_at(markdown, info_end) : 0;
        if (!dialect || opening_break == 0)
        {
            pos = fence + kFence.size();
            continue;
        }
        auto content_begin = info_end + opening_break;
        // Closing fence: first line after the content starting with "```".
        std::size_t closing = std::string_view::npos;
        for (auto line = content_begin; line < markdown.size();)
        {
            if (markdown.substr(line).starts_with(kFence))
            {
                closing = line;
                break;
            }
            auto next = markdown.find('\n', line);
            if (next == std::string_view::npos)
            {
                break;
            }
            line = next + 1;
        }
        if (closing == std::string_view::npos)
        {
            break;
        }
        DiagramBlock block;
        block.dialect = *dialect;
        auto content_end = closing;
        if (content_end > content_begin && markdown[content_end - 1] == '\n')
        {
            --content_end;
        }
        if (content_end > content_begin && markdown[content_end - 1] == '\r')
        {
            --content_end;
        }
        block.source = content_end > content_begin
                           ? std::string(markdown.substr(
                                 content_begin, content_end - content_begin))
                           : std::string();
        block.begin = directive_start(markdown, fence, block.directive)
                          .value_or(fence);
        block.end = closing + kFence.size();
        blocks.push_back(std::move(block));
        pos = blocks.back().end;
    }
    return blocks;
}

std::string replace_blocks(std::string_view markdown,
                           std::vector<DiagramBlock> const &blocks,
                           std::vector<std::string> const &replacements)
{
    std::string out;
    out.reserve(markdown.size());
    std::size_t cursor = 0;
    for (std::size_t i = 0; i < blocks.size() && i < replacements.size(); ++i)
    {
        auto const &block = blocks[i];
        if (block.begin < cursor)
        {
            continue;
        }
        out.append(markdown.substr(cursor, block.begin - cursor));
        out.append(replacements[i]);
        cursor = block.end;
    }
    out.append(markdown.substr(cursor));
    return out;
}

} // namespace folio::engine
