#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace folio::app
{

// Raw flags as given; validation and layering happen in SettingsLoader.
struct CommandLineOptions
{
    std::optional<std::string> source;
    std::optional<std::string> output_dir;
    std::optional<std::string> temp_dir;
    std::optional<std::string> db_path;
    std::optional<std::string> format;
    std::optional<std::string> margins;
    std::optional<std::string> profile;
    std::optional<std::string> max_workers;
    std::optional<std::string> isolation;
    std::optional<std::string> max_diagram_width;
    std::optional<std::string> max_diagram_height;
    std::optional<std::string> author;
    std::optional<std::string> language;
    std::optional<std::string> plantuml_server;
    std::vector<std::pair<std::string, std::string>> set_defaults;

    bool no_parallel = false;
    bool force = false;
    bool save_html = false;
    bool save_html_bundle = false;
    bool no_cleanup = false;
    bool debug = false;
    bool cleanup_db = false;
    bool skip_dependency_check = false;
    bool show_version = false;
    bool show_help = false;
};

// Accepts "--flag value" and "--flag=value". Returns nullopt with `error`
// set on unknown flags, missing values or stray positional arguments.
std::optional<CommandLineOptions>
parse_command_line(std::vector<std::string> const &args, std::string &error);

std::string usage_text();

} // namespace folio::app
