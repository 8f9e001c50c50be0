#include "engine/MarkdownFilters.hpp"

#include "utils/Log.hpp"

#include <cctype>
#include <optional>
#include <system_error>
#include <utility>

namespace folio::engine
{

namespace
{

bool is_space(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

char lower(char ch)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && is_space(text.front()))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back()))
    {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals_at(std::string_view text, std::size_t pos,
                std::string_view word)
{
    if (pos + word.size() > text.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < word.size(); ++i)
    {
        if (lower(text[pos + i]) != lower(word[i]))
        {
            return false;
        }
    }
    return true;
}

std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size())
    {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

// Number of leading '#' when the line is an ATX heading of that level.
std::size_t heading_level(std::string_view line)
{
    std::size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#')
    {
        ++hashes;
    }
    if (hashes == 0 || hashes >= line.size() || !is_space(line[hashes]))
    {
        return 0;
    }
    return hashes;
}

bool is_toc_heading(std::string_view line)
{
    auto level = heading_level(line);
    if (level != 2 && level != 3)
    {
        return false;
    }
    auto rest = line.substr(level);
    std::size_t pos = 0;
    for (std::string_view word : {"table", "of", "contents"})
    {
        auto before = pos;
        while (pos < rest.size() && is_space(rest[pos]))
        {
            ++pos;
        }
        if (pos == before || !iequals_at(rest, pos, word))
        {
            return false;
        }
        pos += word.size();
    }
    return trim(rest.substr(pos)).empty();
}

// Whitespace runs spanning three or more line breaks shrink to one blank
// line.
std::string collapse_blank_lines(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size())
    {
        if (text[pos] != '\n')
        {
            out.push_back(text[pos++]);
            continue;
        }
        auto run_end = pos;
        std::size_t breaks = 0;
        std::size_t last_break = pos;
        while (run_end < text.size() && is_space(text[run_end]))
        {
            if (text[run_end] == '\n')
            {
                ++breaks;
                last_break = run_end;
            }
            ++run_end;
        }
        if (breaks >= 3)
        {
            out.append("\n\n");
            pos = last_break + 1;
        }
        else
        {
            out.append(text.substr(pos, last_break + 1 - pos));
            pos = last_break + 1;
        }
    }
    return out;
}

std::size_t skip_spaces(std::string_view text, std::size_t pos)
{
    while (pos < text.size() && is_space(text[pos]))
    {
        ++pos;
    }
    return pos;
}

// Each matcher returns the length of the marker starting at `pos`, 0 if none.
std::size_t match_comment_marker(std::string_view text, std::size_t pos)
{
    if (!text.substr(pos).starts_with("<!--"))
    {
        return 0;
    }
    auto cursor = skip_spaces(text, pos + 4);
    if (!iequals_at(text, cursor, "page-break"))
    {
        return 0;
    }
    cursor = skip_spaces(text, cursor + 10);
    if (!text.substr(cursor).starts_with("-->"))
    {
        return 0;
    }
    return cursor + 3 - pos;
}

std::size_t match_fence_marker(std::string_view text, std::size_t pos)
{
    constexpr std::string_view marker = "```page-break\n```";
    return iequals_at(text, pos, marker) ? marker.size() : 0;
}

std::size_t match_tag_marker(std::string_view text, std::size_t pos)
{
    constexpr std::string_view marker = "<page-break>";
    return iequals_at(text, pos, marker) ? marker.size() : 0;
}

std::size_t match_rule_marker(std::string_view text, std::size_t pos)
{
    if (!text.substr(pos).starts_with("---"))
    {
        return 0;
    }
    auto cursor = pos + 3;
    while (cursor < text.size() && is_space(text[cursor]) &&
           text[cursor] != '\n')
    {
        ++cursor;
    }
    if (cursor >= text.size() || text[cursor] != '\n')
    {
        return 0;
    }
    cursor = skip_spaces(text, cursor + 1);
    constexpr std::string_view attribute = "{.page-break}";
    if (!iequals_at(text, cursor, attribute))
    {
        return 0;
    }
    return cursor + attribute.size() - pos;
}

std::size_t match_div_marker(std::string_view text, std::size_t pos)
{
    constexpr std::string_view marker = kPageBreakDiv;
    return text.substr(pos).starts_with(marker) ? marker.size() : 0;
}

bool is_external_reference(std::string_view ref)
{
    return ref.starts_with("http") || ref.starts_with("data:");
}

bool is_inside(std::filesystem::path const &candidate,
               std::filesystem::path const &dir)
{
    std::error_code ec;
    auto const c = std::filesystem::absolute(candidate, ec)
                       .lexically_normal()
                       .generic_string();
    auto const d =
        std::filesystem::absolute(dir, ec).lexically_normal().generic_string();
    return !d.empty() && c.size() > d.size() && c.starts_with(d) &&
           (d.back() == '/' || c[d.size()] == '/');
}

class ImageEmbedder
{
  public:
    ImageEmbedder(std::filesystem::path source_dir,
                  std::filesystem::path temp_dir)
        : source_dir_(std::move(source_dir)), temp_dir_(std::move(temp_dir))
    {
    }

    // New reference for `ref`, or nullopt to keep it as written.
    std::optional<std::string> rewrite(std::string_view ref)
    {
        if (is_external_reference(ref))
        {
            return std::nullopt;
        }
        std::filesystem::path original{std::string(ref)};
        auto resolved =
            original.is_absolute() ? original : source_dir_ / original;
        if (is_inside(resolved, temp_dir_) ||
            (original.is_relative() && is_inside(original, temp_dir_)))
        {
            return std::nullopt;
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(resolved, ec))
        {
            FOLIO_LOG_WARN("image not found: {}", resolved.string());
            ++result.missing;
            return std::nullopt;
        }
        auto target = temp_dir_ / ("embedded_" + resolved.filename().string());
        std::filesystem::create_directories(temp_dir_, ec);
        std::filesystem::copy_file(
            resolved, target, std::filesystem::copy_options::overwrite_existing,
            ec);
        if (ec)
        {
            FOLIO_LOG_WARN("failed to embed image {}: {}", std::string(ref),
                           ec.message());
            return std::nullopt;
        }
        auto absolute = std::filesystem::absolute(target, ec);
        if (ec)
        {
            absolute = target;
        }
        FOLIO_LOG_DEBUG("embedded image {} -> {}", std::string(ref),
                        absolute.string());
        result.embedded.push_back({std::string(ref), absolute});
        return absolute.generic_string();
    }

    EmbedResult result;

  private:
    std::filesystem::path source_dir_;
    std::filesystem::path temp_dir_;
};

} // namespace

std::string filter_print_sections(std::string_view markdown)
{
    auto lines = split_lines(markdown);
    std::string out;
    out.reserve(markdown.size());
    bool skipping = false;
    bool filtered = false;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        auto line = lines[i];
        if (!skipping && is_toc_heading(line))
        {
            skipping = true;
            filtered = true;
            continue;
        }
        if (skipping)
        {
            auto level = heading_level(line);
            if (level == 0 || level > 3)
            {
                continue;
            }
            skipping = is_toc_heading(line);
            if (skipping)
            {
                continue;
            }
        }
        out.append(line);
        if (i + 1 < lines.size())
        {
            out.push_back('\n');
        }
    }
    if (filtered)
    {
        FOLIO_LOG_DEBUG("filtered table of contents section for print");
    }
    return collapse_blank_lines(out);
}

std::string process_page_breaks(std::string_view markdown, bool keep)
{
    using Matcher = std::size_t (*)(std::string_view, std::size_t);
    static constexpr Matcher kMatchers[] = {
        match_comment_marker, match_fence_marker, match_tag_marker,
        match_rule_marker, match_div_marker};

    std::string out;
    out.reserve(markdown.size());
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < markdown.size())
    {
        std::size_t matched = 0;
        for (auto matcher : kMatchers)
        {
            matched = matcher(markdown, pos);
            if (matched != 0)
            {
                break;
            }
        }
        if (matched == 0)
        {
            out.push_back(markdown[pos++]);
            continue;
        }
        ++count;
        if (keep)
        {
            out.append(kPageBreakDiv);
        }
        pos += matched;
    }
    if (count != 0)
    {
        FOLIO_LOG_DEBUG("{} {} page break marker(s)", keep ? "kept" : "removed",
                        count);
    }
    return out;
}

std::string humanize_stem(std::string_view stem)
{
    std::string out;
    out.reserve(stem.size());
    bool word_start = true;
    for (char ch : stem)
    {
        if (ch == '_' || ch == '-')
        {
            ch = ' ';
        }
        auto const uch = static_cast<unsigned char>(ch);
        if (std::isalpha(uch))
        {
            out.push_back(static_cast<char>(word_start ? std::toupper(uch)
                                                       : std::tolower(uch)));
            word_start = false;
        }
        else
        {
            out.push_back(ch);
            word_start = true;
        }
    }
    auto trimmed = trim(out);
    return trimmed.empty() ? std::string(stem) : std::string(trimmed);
}

std::string extract_title(std::string_view markdown,
                          std::filesystem::path const &source)
{
    auto lines = split_lines(markdown);
    for (auto line : lines)
    {
        auto stripped = trim(line);
        if (stripped.starts_with("# "))
        {
            auto text = trim(stripped.substr(2));
            if (!text.empty())
            {
                return std::string(text);
            }
        }
    }
    for (std::size_t i = 0; i + 1 < lines.size(); ++i)
    {
        auto text = trim(lines[i]);
        auto underline = trim(lines[i + 1]);
        if (text.empty() || underline.empty())
        {
            continue;
        }
        if (underline.find_first_not_of('=') == std::string_view::npos)
        {
            return std::string(text);
        }
    }
    return humanize_stem(source.stem().string());
}

EmbedResult embed_local_images(std::string_view markdown,
                               std::filesystem::path const &source_dir,
                               std::filesystem::path const &temp_dir)
{
    ImageEmbedder embedder(source_dir, temp_dir);
    std::string out;
    out.reserve(markdown.size());
    std::size_t pos = 0;
    while (pos < markdown.size())
    {
        // ![alt](ref)
        if (markdown.substr(pos).starts_with("!["))
        {
            auto alt_end = markdown.find(']', pos + 2);
            if (alt_end != std::string_view::npos &&
                alt_end + 1 < markdown.size() && markdown[alt_end + 1] == '(')
            {
                auto ref_begin = alt_end + 2;
                auto ref_end = markdown.find(')', ref_begin);
                if (ref_end != std::string_view::npos && ref_end > ref_begin)
                {
                    auto ref = markdown.substr(ref_begin, ref_end - ref_begin);
                    auto replacement = embedder.rewrite(ref);
                    out.append(markdown.substr(pos, ref_begin - pos));
                    out.append(replacement ? std::string_view(*replacement)
                                           : ref);
                    out.push_back(')');
                    pos = ref_end + 1;
                    continue;
                }
            }
        }
        // <img ... src="ref" ...>
        if (iequals_at(markdown, pos, "<img") && pos + 4 < markdown.size() &&
            is_space(markdown[pos + 4]))
        {
            auto tag_end = markdown.find('>', pos);
            if (tag_end != std::string_view::npos)
            {
                auto tag = markdown.substr(pos, tag_end + 1 - pos);
                auto src = tag.find("src=");
                if (src != std::string_view::npos && src + 4 < tag.size() &&
                    (tag[src + 4] == '"' || tag[src + 4] == '\''))
                {
                    auto quote = tag[src + 4];
                    auto ref_begin = src + 5;
                    auto ref_end = tag.find(quote, ref_begin);
                    if (ref_end != std::string_view::npos && ref_end > ref_begin)
                    {
                        auto ref = tag.substr(ref_begin, ref_end - ref_begin);
                        auto replacement = embedder.rewrite(ref);
                        out.append(tag.substr(0, ref_begin));
                        out.append(replacement ? std::string_view(*replacement)
                                               : ref);
                        out.append(tag.substr(ref_end));
                        pos = tag_end + 1;
                        continue;
                    }
                }
            }
        }
        out.push_back(markdown[pos++]);
    }
    embedder.result.markdown = std::move(out);
    return std::move(embedder.result);
}

} // namespace folio::engine
