#include "engine/ServiceRenderAdapter.hpp"

#include "engine/ImageFit.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace folio::engine
{

namespace
{

constexpr std::array<std::string_view, 8> kTransientIndicators = {
    "ssl",          "tls",         "timeout",
    "timed out",    "connection reset", "connection error",
    "broken pipe",  "remote disconnected",
};

} // namespace

bool is_transient_service_error(std::string_view message)
{
    std::string lowered(message);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return std::any_of(kTransientIndicators.begin(), kTransientIndicators.end(),
                       [&lowered](std::string_view indicator)
                       { return lowered.find(indicator) != std::string::npos; });
}

ServiceRenderAdapter::ServiceRenderAdapter(DiagramClientFactory factory,
                                           PollingClock &clock,
                                           ServiceRenderOptions options)
    : factory_(std::move(factory)), clock_(clock), options_(options)
{
}

RenderResult ServiceRenderAdapter::render(
    std::string const &source, std::filesystem::path const &output_path,
    RenderDirective const &directive)
{
    last_attempts_ = 0;
    std::string last_error;
    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt)
    {
        last_attempts_ = attempt;
        if (!client_)
        {
            client_ = factory_();
        }
        if (!client_)
        {
            return RenderResult::fatal("no PlantUML client available");
        }
        try
        {
            auto png = client_->render_png(source);
            if (!folio::utils::write_file_atomic(output_path, png) ||
                !folio::utils::is_nonempty_file(output_path))
            {
                return RenderResult::fatal(
                    "PlantUML diagram file was not created or is empty");
            }
            if (attempt > 1)
            {
                FOLIO_LOG_DEBUG("PlantUML diagram rendered on attempt {}",
                                attempt);
            }
            auto raster = read_png_size(std::span<std::uint8_t const>(png));
            if (!raster)
            {
                return RenderResult::fatal(
                    "PlantUML server response is not a PNG image");
            }
            auto display = fit_display_size(
                *raster, directive, page_width_px(options_.max_width),
                options_.max_width, options_.max_height);
            return RenderResult::success(*raster, display);
        }
        catch (std::runtime_error const &ex)
        {
            last_error =
                std::format("Failed to render PlantUML diagram: {}", ex.what());
        }
        if (!is_transient_service_error(last_error) ||
            attempt == options_.max_attempts)
        {
            break;
        }
        auto backoff = std::chrono::seconds(1LL << attempt);
        FOLIO_LOG_WARN("PlantUML request failed (attempt {}/{}); retrying in "
                       "{}s",
                       attempt, options_.max_attempts, backoff.count());
        clock_.sleep_for(backoff);
        // Drop the client so no broken connection state carries over.
        client_.reset();
    }
    FOLIO_LOG_ERROR("{}", last_error);
    return RenderResult::fatal(last_error);
}

} // namespace folio::engine
