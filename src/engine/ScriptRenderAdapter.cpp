#include "engine/ScriptRenderAdapter.hpp"

#include "engine/ImageFit.hpp"
#include "utils/FS.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cmath>
#include <format>

namespace folio::engine
{

namespace
{

constexpr char const kErrorProbeScript[] =
    "const svg = document.querySelector('.mermaid svg');"
    "if (!svg) return null;"
    "if (svg.getAttribute('aria-roledescription') !== 'error' &&"
    "    !svg.querySelector('.error-icon')) return null;"
    "const text = svg.querySelector('.error-text');"
    "return text ? text.textContent : 'syntax error in diagram';";

std::string escape_html(std::string const &text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char ch : text)
    {
        switch (ch)
        {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out.push_back(ch);
        }
    }
    return out;
}

bool has_visible_markup(std::string const &html)
{
    return html.find_first_not_of(" \t\r\n") != std::string::npos;
}

std::string rescale_script(std::uint32_t target_width)
{
    return std::format(
        "const svg = document.querySelector('.mermaid svg');"
        "if (!svg) return false;"
        "const target = {0};"
        "const viewBox = svg.getAttribute('viewBox');"
        "if (viewBox) {{"
        "  const parts = viewBox.split(/[\\s,]+/);"
        "  const w = parseFloat(parts[2]);"
        "  const h = parseFloat(parts[3]);"
        "  if (w > 0 && h > 0) {{"
        "    svg.setAttribute('width', target);"
        "    svg.setAttribute('height', Math.ceil(h * target / w));"
        "    svg.style.maxWidth = 'none';"
        "    return true;"
        "  }}"
        "}}"
        "const rect = svg.getBoundingClientRect();"
        "if (rect.width > 0) {{"
        "  svg.setAttribute('width', target);"
        "  svg.setAttribute('height', Math.ceil(rect.height * target / rect.width));"
        "  svg.style.maxWidth = 'none';"
        "  return true;"
        "}}"
        "return false;",
        target_width);
}

} // namespace

ScriptRenderAdapter::ScriptRenderAdapter(BrowserSession &session,
                                         PollingClock &clock,
                                         ScriptRenderOptions options)
    : session_(session), clock_(clock), options_(std::move(options))
{
}

std::string ScriptRenderAdapter::build_document(std::string const &source) const
{
    return std::format(
        R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<script src="{0}"></script>
<style>
body {{ margin: 0; padding: 10px; background: white; font-family: Arial, sans-serif; }}
.mermaid {{ display: inline-block; padding: 5px; background: white; text-align: center; }}
.mermaid svg {{ display: block; max-width: none; height: auto; font-family: Arial, sans-serif; }}
.mermaid .edgePath .path {{ stroke-width: 1.5px; }}
</style>
</head>
<body>
<div class="mermaid">
{1}
</div>
<script>
mermaid.initialize({{
  startOnLoad: true,
  theme: 'default',
  flowchart: {{ useMaxWidth: false, htmlLabels: true, curve: 'basis',
               nodeSpacing: 30, rankSpacing: 30 }},
  sequence: {{ useMaxWidth: false, messageFontSize: 12, actorFontSize: 12 }},
  gantt: {{ useMaxWidth: false }}
}});
</script>
</body>
</html>
)",
        options_.runtime_url, escape_html(source));
}

RenderResult ScriptRenderAdapter::render(
    std::string const &source, std::filesystem::path const &output_path,
    RenderDirective const &directive)
{
    last_stabilized_ = false;
    try
    {
        auto &page = session_.ensure_ready();
        return render_on(page, source, output_path, directive);
    }
    catch (BrowserError const &ex)
    {
        auto message = std::format("Mermaid render failed: {}", ex.what());
        if (is_crash_indicator(ex.what()))
        {
            return RenderResult::retryable(std::move(message));
        }
        return RenderResult::fatal(std::move(message));
    }
}

bool ScriptRenderAdapter::wait_for_svg(BrowserPage &page,
                                       std::chrono::milliseconds start)
{
    while (clock_.now() - start < options_.max_wait)
    {
        if (auto svg = page.query_selector(".mermaid svg"))
        {
            if (has_visible_markup(page.inner_html(*svg)))
            {
                FOLIO_LOG_DEBUG("Mermaid SVG appeared after {} ms",
                                (clock_.now() - start).count());
                return true;
            }
        }
        clock_.sleep_for(options_.svg_poll_interval);
    }
    return false;
}

bool ScriptRenderAdapter::wait_for_stable_layout(
    BrowserPage &page, std::chrono::milliseconds start)
{
    auto container = page.query_selector(".mermaid");
    if (!container)
    {
        return false;
    }
    int stable = 0;
    std::optional<ElementBox> previous;
    while (clock_.now() - start < options_.max_wait &&
           stable < options_.stability_checks)
    {
        clock_.sleep_for(options_.stability_poll_interval);
        auto current = page.bounding_box(*container);
        if (current && previous)
        {
            bool same_width = std::abs(current->width - previous->width) <
                              options_.stability_tolerance_px;
            bool same_height = std::abs(current->height - previous->height) <
                               options_.stability_tolerance_px;
            stable = (same_width && same_height) ? stable + 1 : 0;
        }
        previous = current;
    }
    return stable >= options_.stability_checks;
}

RenderResult ScriptRenderAdapter::render_on(
    BrowserPage &page, std::string const &source,
    std::filesystem::path const &output_path, RenderDirective const &directive)
{
    auto [viewport_width, viewport_height] =
        diagram_viewport(options_.max_width, options_.max_height);
    page.set_viewport(viewport_width, viewport_height);
    page.set_content(build_document(source));

    auto const start = clock_.now();
    if (!wait_for_svg(page, start))
    {
        FOLIO_LOG_WARN("Mermaid SVG did not appear within {} ms; "
                       "capturing the page as it is",
                       options_.max_wait.count());
    }
    else
    {
        auto probe =
            folio::json::Document::parse(page.evaluate(kErrorProbeScript));
        if (probe.is_valid() && yyjson_is_str(probe.root()))
        {
            return RenderResult::fatal(std::format(
                "Mermaid syntax error: {}", yyjson_get_str(probe.root())));
        }

        last_stabilized_ = wait_for_stable_layout(page, start);
        if (!last_stabilized_)
        {
            FOLIO_LOG_WARN("Mermaid layout did not stabilize within {} ms; "
                           "capturing anyway",
                           options_.max_wait.count());
        }
    }

    auto const page_width = page_width_px(options_.max_width);
    if (!directive.no_resize)
    {
        auto target = clamp_pixels(static_cast<double>(page_width) *
                                   directive.scale_percent / 100.0);
        auto scaled = folio::json::Document::parse(
            page.evaluate(rescale_script(target)));
        if (scaled.is_valid() && yyjson_is_true(scaled.root()))
        {
            FOLIO_LOG_DEBUG("scaled SVG to {}px before capture", target);
        }
        clock_.sleep_for(options_.relayout_wait);
    }

    std::vector<std::uint8_t> png;
    auto container = page.query_selector(".mermaid");
    std::optional<ElementBox> box;
    if (container)
    {
        box = page.bounding_box(*container);
    }
    if (container && box && box->width > 0 && box->height > 0)
    {
        png = page.screenshot_element(*container);
    }
    else
    {
        FOLIO_LOG_DEBUG("diagram element unavailable; capturing full page");
        png = page.screenshot_page();
    }

    if (!folio::utils::write_file_atomic(output_path, png) ||
        !folio::utils::is_nonempty_file(output_path))
    {
        return RenderResult::fatal(
            std::format("cannot write diagram image {}", output_path.string()));
    }
    auto raster = read_png_size(std::span<std::uint8_t const>(png));
    if (!raster)
    {
        return RenderResult::fatal("Mermaid capture is not a PNG image");
    }
    auto display = fit_display_size(*raster, directive, page_width,
                                    options_.max_width, options_.max_height);
    return RenderResult::success(*raster, display);
}

} // namespace folio::engine
