#include "engine/HtmlTemplate.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <format>
#include <map>
#include <system_error>
#include <vector>

namespace folio::engine
{

namespace
{

// Arguments: {0} margin, {1} base font size, {2}..{6} heading sizes h1..h3
// plus code/pre size, {7} h4, {8} h5, {9} h6.
constexpr std::string_view kPrintStylesheet = R"(
        @page {{
            margin: {0};
            size: A4 portrait;
            width: 210mm;
            height: 297mm;
        }}
        body {{
            font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, 'Helvetica Neue', Arial, sans-serif;
            line-height: 1.4;
            color: #333;
            max-width: none;
            margin: 0;
            padding: 0;
            font-size: {1};
            width: 100%;
            box-sizing: border-box;
        }}
        * {{ box-sizing: border-box; }}
        h1, h2, h3, h4, h5, h6 {{
            color: #2c3e50;
            margin-top: 0.8em;
            margin-bottom: 0.3em;
            font-weight: 600;
            page-break-inside: avoid;
            break-inside: avoid;
        }}
        h1 {{ font-size: {2}em; border-bottom: 2px solid #3498db; padding-bottom: 0.2em; }}
        h2 {{ font-size: {3}em; border-bottom: 1px solid #bdc3c7; padding-bottom: 0.1em; }}
        h3 {{ font-size: {4}em; }}
        h4 {{ font-size: {7}em; text-decoration: underline; }}
        h5 {{ font-size: {8}em; text-decoration: underline; }}
        h6 {{ font-size: {9}em; text-decoration: underline; }}
        h1, h2, h3 {{ page-break-after: avoid; break-after: avoid; }}
        p {{ margin: 0.5em 0; text-align: justify; }}
        p, li {{ orphans: 3; widows: 3; }}
        code {{
            background-color: #f8f9fa;
            border: 1px solid #e9ecef;
            border-radius: 3px;
            padding: 0.1em 0.3em;
            font-family: 'Courier New', Consolas, monospace;
            font-size: {5}em;
            color: #e83e8c;
        }}
        pre {{
            background-color: #f8f9fa;
            border: 1px solid #e9ecef;
            border-radius: 5px;
            padding: 0.5em;
            overflow-x: auto;
            margin: 0.5em 0;
            font-size: {6}em;
        }}
        pre code {{ background: none; border: none; padding: 0; color: #333; }}
        blockquote {{
            border-left: 4px solid #3498db;
            margin: 0.5em 0;
            padding: 0.3em 0.8em;
            background-color: #f8f9fa;
            color: #555;
        }}
        table {{
            border-collapse: collapse;
            width: 100%;
            max-width: 100%;
            table-layout: auto;
            margin: 0.5em 0;
        }}
        table, table *, th, td {{
            font-size: {1} !important;
            font-family: inherit !important;
            line-height: inherit !important;
        }}
        th, td {{ border: 1px solid #ddd; padding: 0.3em; text-align: left; }}
        th {{ background-color: #f8f9fa; font-weight: 600; }}
        ul, ol {{ margin: 0.5em 0; padding-left: 1.5em; }}
        li {{ margin: 0.2em 0; }}
        ul ul, ol ol, ul ol, ol ul {{ margin: 0.2em 0; padding-left: 1.2em; }}
        img {{ max-width: 100%; height: auto; display: block; margin: 0.5em auto; }}
        a {{ color: #3498db; text-decoration: none; }}
        .page-break {{ page-break-before: always; }}
        pre, blockquote, table, img {{ page-break-inside: avoid; break-inside: avoid; }}
)";

constexpr std::string_view kPaperwhiteStylesheet = R"(/* Kindle Paperwhite (11th generation): 6.8" 300 ppi E Ink */
body {
    font-family: "Bookerly", "Caecilia", "Helvetica", "Arial", sans-serif;
    font-size: 13px;
    line-height: 1.6;
    color: #000000;
    margin: 0;
    padding: 0.8em;
    text-align: justify;
    hyphens: auto;
    -webkit-hyphens: auto;
}

@media only screen and (min-width: 1648px) and (max-width: 1648px) and (min-height: 1236px) and (max-height: 1236px) {
    body { font-size: 14px; line-height: 1.7; padding: 1em; }
}

h1, h2, h3, h4, h5, h6 { color: #000000; font-weight: bold; page-break-after: avoid; }
h1 { font-size: 1.6em; margin: 1em 0 0.5em 0; }
h2 { font-size: 1.4em; margin: 0.8em 0 0.4em 0; }
h3 { font-size: 1.2em; margin: 0.7em 0 0.3em 0; }
h4 { font-size: 1.1em; margin: 0.6em 0 0.3em 0; text-decoration: underline; }
h5 { font-size: 1.05em; margin: 0.5em 0 0.3em 0; text-decoration: underline; }
h6 { font-size: 1em; margin: 0.5em 0 0.3em 0; text-decoration: underline; }

p { margin: 0.5em 0; }
pre { background-color: #f5f5f5; padding: 0.5em; margin: 0.5em 0; }
code { background-color: #f5f5f5; padding: 0.1em 0.3em; }
table { border-collapse: collapse; width: 100%; margin: 0.5em 0; }
th, td { border: 1px solid #ddd; padding: 0.3em; }
th { background-color: #f8f8f8; }
img { max-width: 100%; height: auto; display: block; margin: 0.5em auto; }
ul, ol { margin: 0.5em 0; padding-left: 1.5em; }
li { margin: 0.2em 0; }
blockquote { border-left: 3px solid #ccc; margin: 0.5em 0; padding: 0.3em 0.8em; background-color: #f9f9f9; }
a { color: #0066cc; text-decoration: none; }
)";

std::string scaled(double factor, double font_scale)
{
    return std::format("{:.1f}", factor * font_scale);
}

std::string escape_html(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            out.append("&quot;");
            break;
        default:
            out.push_back(ch);
        }
    }
    return out;
}

std::size_t find_ci(std::string_view haystack, std::string_view needle,
                    std::size_t from = 0)
{
    if (needle.size() > haystack.size())
    {
        return std::string_view::npos;
    }
    for (auto pos = from; pos + needle.size() <= haystack.size(); ++pos)
    {
        bool match = true;
        for (std::size_t i = 0; i < needle.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(haystack[pos + i])) !=
                std::tolower(static_cast<unsigned char>(needle[i])))
            {
                match = false;
                break;
            }
        }
        if (match)
        {
            return pos;
        }
    }
    return std::string_view::npos;
}

struct AssetReference
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

// src="..." / src='...' values and url(...) arguments, in document order.
std::vector<AssetReference> find_asset_references(std::string_view html)
{
    std::vector<AssetReference> refs;
    std::size_t pos = 0;
    while (pos < html.size())
    {
        if (html.substr(pos).starts_with("src=") && pos + 4 < html.size() &&
            (html[pos + 4] == '"' || html[pos + 4] == '\''))
        {
            auto quote = html[pos + 4];
            auto end = html.find(quote, pos + 5);
            if (end == std::string_view::npos)
            {
                break;
            }
            refs.push_back({pos + 5, end});
            pos = end + 1;
            continue;
        }
        if (html.substr(pos).starts_with("url("))
        {
            auto end = html.find(')', pos + 4);
            if (end == std::string_view::npos)
            {
                break;
            }
            auto begin = pos + 4;
            if (end > begin && (html[begin] == '"' || html[begin] == '\'') &&
                html[end - 1] == html[begin])
            {
                ++begin;
                --end;
                refs.push_back({begin, end});
                pos = end + 2;
                continue;
            }
            refs.push_back({begin, end});
            pos = end + 1;
            continue;
        }
        ++pos;
    }
    return refs;
}

} // namespace

std::string print_stylesheet(StyleProfile const &profile,
                             PageMargins const &margins)
{
    auto const margin = std::format(
        "{} {} {} {}", margin_css_cm(margins.top), margin_css_cm(margins.right),
        margin_css_cm(margins.bottom), margin_css_cm(margins.left));
    auto const base = std::string(profile.base_font_size);
    auto const scale = profile.font_scale;
    auto const h1 = scaled(1.6, scale);
    auto const h2 = scaled(1.3, scale);
    auto const h3 = scaled(1.1, scale);
    auto const code = scaled(0.8, scale);
    auto const h4 = scaled(1.0, scale);
    auto const h5 = scaled(0.9, scale);
    auto const h6 = scaled(0.8, scale);
    return std::vformat(kPrintStylesheet,
                        std::make_format_args(margin, base, h1, h2, h3, code,
                                              code, h4, h5, h6));
}

std::string_view extract_body(std::string_view html)
{
    auto open = find_ci(html, "<body");
    if (open == std::string_view::npos)
    {
        return html;
    }
    auto open_end = html.find('>', open);
    auto close = find_ci(html, "</body>", open);
    if (open_end == std::string_view::npos || close == std::string_view::npos ||
        close < open_end)
    {
        return html;
    }
    return html.substr(open_end + 1, close - open_end - 1);
}

std::string apply_html_template(std::string_view externalized_html,
                                StyleProfile const &profile,
                                PageMargins const &margins,
                                std::string_view title)
{
    std::string out;
    out.reserve(externalized_html.size() + 8192);
    out.append("<!DOCTYPE html>\n<html>\n<head>\n"
               "    <meta charset=\"utf-8\">\n"
               "    <meta name=\"viewport\" content=\"width=device-width, "
               "initial-scale=1.0\">\n");
    out.append("    <title>").append(escape_html(title)).append("</title>\n");
    out.append("    <style>");
    out.append(print_stylesheet(profile, margins));
    out.append("    </style>\n</head>\n<body>\n");
    out.append(extract_body(externalized_html));
    out.append("\n</body>\n</html>\n");
    return out;
}

std::string_view paperwhite_stylesheet() noexcept
{
    return kPaperwhiteStylesheet;
}

std::optional<HtmlBundle> save_html_bundle(std::string_view html,
                                           std::filesystem::path const &bundle_dir,
                                           std::string_view stem)
{
    auto const assets_dir = bundle_dir / "assets";
    if (!folio::utils::ensure_directory(assets_dir))
    {
        FOLIO_LOG_ERROR("cannot create bundle directory {}",
                        assets_dir.string());
        return std::nullopt;
    }

    std::map<std::string, std::string> copied;
    std::string out;
    out.reserve(html.size());
    std::size_t cursor = 0;
    for (auto const &ref : find_asset_references(html))
    {
        auto value = html.substr(ref.begin, ref.end - ref.begin);
        std::filesystem::path file{std::string(value)};
        std::error_code ec;
        if (!file.is_absolute() || !std::filesystem::is_regular_file(file, ec))
        {
            continue;
        }
        auto key = file.string();
        auto it = copied.find(key);
        if (it == copied.end())
        {
            auto dest = assets_dir / file.filename();
            std::filesystem::copy_file(
                file, dest, std::filesystem::copy_options::overwrite_existing,
                ec);
            if (ec)
            {
                FOLIO_LOG_WARN("cannot copy asset {}: {}", key, ec.message());
                continue;
            }
            it = copied.emplace(key, "assets/" + file.filename().string())
                     .first;
        }
        out.append(html.substr(cursor, ref.begin - cursor));
        out.append(it->second);
        cursor = ref.end;
    }
    out.append(html.substr(cursor));

    HtmlBundle bundle;
    bundle.html_path = bundle_dir / (std::string(stem) + ".html");
    bundle.assets = copied.size();
    if (!folio::utils::write_file_atomic(bundle.html_path, out))
    {
        FOLIO_LOG_ERROR("cannot write {}", bundle.html_path.string());
        return std::nullopt;
    }
    FOLIO_LOG_INFO("saved HTML bundle to {} ({} assets)", bundle_dir.string(),
                   bundle.assets);
    return bundle;
}

} // namespace folio::engine
