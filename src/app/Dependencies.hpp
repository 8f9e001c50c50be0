#pragma once

#include "engine/ConversionSettings.hpp"

#include <functional>
#include <string>
#include <vector>

namespace folio::app
{

struct DependencyReport
{
    std::vector<std::string> missing;

    bool ok() const noexcept
    {
        return missing.empty();
    }
};

using ToolProbe = std::function<bool(std::string const &)>;

// pandoc always; the browser driver when PDF output or a Mermaid diagram
// needs it; ebook-convert for MOBI.
DependencyReport check_dependencies(folio::engine::ConversionSettings const &settings,
                                    bool needs_browser, ToolProbe const &probe);

DependencyReport check_dependencies(folio::engine::ConversionSettings const &settings,
                                    bool needs_browser);

} // namespace folio::app
