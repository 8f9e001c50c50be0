#pragma once

#include "engine/Dimension.hpp"
#include "engine/StyleProfiles.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace folio::engine {

enum class IsolationMode { Process, Thread };

inline constexpr char const kDefaultPlantUmlServer[] =
    "http://www.plantuml.com/plantuml";

// Fully resolved run configuration; built by the app layer and handed to
// every worker by value.
struct ConversionSettings {
  std::filesystem::path source_dir = "docs";
  std::filesystem::path output_dir = "output";
  std::filesystem::path temp_dir = "temp";
  std::filesystem::path db_path;

  OutputFormat format = OutputFormat::Pdf;
  std::string profile = "a4-print";
  // Raw margin specification as given; validated before the batch starts.
  std::string margins = "1in 0.75in";
  Dimension max_width = Pixels{kDefaultPageWidthPx};
  Dimension max_height = Pixels{kDefaultPageHeightPx};

  std::size_t max_workers = 4;
  bool parallel = true;
  IsolationMode isolation = IsolationMode::Process;

  bool force = false;
  bool save_html = false;
  bool save_html_bundle = false;
  bool cleanup = true;

  std::string author = "Unknown Author";
  std::string language = "en";
  std::string plantuml_server = kDefaultPlantUmlServer;
  std::string chromedriver = "chromedriver";
  std::string browser_binary;

  // Directory the artifacts of the selected format are written to.
  std::filesystem::path artifact_dir() const {
    return output_dir / std::string(format_name(format));
  }
  std::filesystem::path html_dir() const { return output_dir / "html"; }
};

} // namespace folio::engine
