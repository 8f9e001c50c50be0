#include "app/Dependencies.hpp"

#include "utils/Log.hpp"
#include "utils/Process.hpp"

namespace folio::app
{

DependencyReport check_dependencies(folio::engine::ConversionSettings const &settings,
                                    bool needs_browser, ToolProbe const &probe)
{
    DependencyReport report;
    auto require = [&](std::string const &tool)
    {
        if (probe(tool))
        {
            FOLIO_LOG_DEBUG("found {}", tool);
            return;
        }
        report.missing.push_back(tool);
    };
    require("pandoc");
    if (settings.format == folio::engine::OutputFormat::Pdf || needs_browser)
    {
        require(settings.chromedriver);
    }
    if (settings.format == folio::engine::OutputFormat::Mobi)
    {
        require("ebook-convert");
    }
    return report;
}

DependencyReport check_dependencies(folio::engine::ConversionSettings const &settings,
                                    bool needs_browser)
{
    return check_dependencies(settings, needs_browser,
                              [](std::string const &tool)
                              { return folio::utils::tool_available(tool); });
}

} // namespace folio::app
