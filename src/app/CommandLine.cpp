#include "app/CommandLine.hpp"

#include <array>
#include <format>
#include <string_view>

namespace folio::app
{

namespace
{

using ValueSlot = std::optional<std::string> CommandLineOptions::*;
using FlagSlot = bool CommandLineOptions::*;

struct ValueFlag
{
    std::string_view name;
    ValueSlot slot;
};

struct SwitchFlag
{
    std::string_view name;
    FlagSlot slot;
};

constexpr std::array<ValueFlag, 14> kValueFlags = {{
    {"--source", &CommandLineOptions::source},
    {"--output-dir", &CommandLineOptions::output_dir},
    {"--temp-dir", &CommandLineOptions::temp_dir},
    {"--db-path", &CommandLineOptions::db_path},
    {"--format", &CommandLineOptions::format},
    {"--margins", &CommandLineOptions::margins},
    {"--profile", &CommandLineOptions::profile},
    {"--max-workers", &CommandLineOptions::max_workers},
    {"--isolation", &CommandLineOptions::isolation},
    {"--max-diagram-width", &CommandLineOptions::max_diagram_width},
    {"--max-diagram-height", &CommandLineOptions::max_diagram_height},
    {"--author", &CommandLineOptions::author},
    {"--language", &CommandLineOptions::language},
    {"--plantuml-server", &CommandLineOptions::plantuml_server},
}};

constexpr std::array<SwitchFlag, 10> kSwitchFlags = {{
    {"--no-parallel", &CommandLineOptions::no_parallel},
    {"--force", &CommandLineOptions::force},
    {"--save-html", &CommandLineOptions::save_html},
    {"--save-html-bundle", &CommandLineOptions::save_html_bundle},
    {"--no-cleanup", &CommandLineOptions::no_cleanup},
    {"--debug", &CommandLineOptions::debug},
    {"--cleanup-db", &CommandLineOptions::cleanup_db},
    {"--skip-dependency-check", &CommandLineOptions::skip_dependency_check},
    {"--version", &CommandLineOptions::show_version},
    {"--help", &CommandLineOptions::show_help},
}};

} // namespace

std::optional<CommandLineOptions>
parse_command_line(std::vector<std::string> const &args, std::string &error)
{
    CommandLineOptions options;
    for (std::size_t index = 0; index < args.size(); ++index)
    {
        std::string_view arg = args[index];
        if (arg == "-h")
        {
            options.show_help = true;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            error = std::format("unexpected argument '{}'", arg);
            return std::nullopt;
        }

        std::string_view name = arg;
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); eq != std::string_view::npos)
        {
            name = arg.substr(0, eq);
            inline_value = std::string(arg.substr(eq + 1));
        }

        bool matched = false;
        for (auto const &flag : kSwitchFlags)
        {
            if (flag.name == name)
            {
                if (inline_value)
                {
                    error = std::format("{} does not take a value", name);
                    return std::nullopt;
                }
                options.*flag.slot = true;
                matched = true;
                break;
            }
        }
        if (matched)
        {
            continue;
        }

        auto take_value = [&]() -> std::optional<std::string>
        {
            if (inline_value)
            {
                return inline_value;
            }
            if (index + 1 >= args.size())
            {
                error = std::format("{} requires a value", name);
                return std::nullopt;
            }
            return args[++index];
        };

        if (name == "--set-default")
        {
            auto value = take_value();
            if (!value)
            {
                return std::nullopt;
            }
            auto eq = value->find('=');
            if (eq == std::string::npos || eq == 0)
            {
                error = "--set-default expects KEY=VALUE";
                return std::nullopt;
            }
            options.set_defaults.emplace_back(value->substr(0, eq),
                                              value->substr(eq + 1));
            continue;
        }

        for (auto const &flag : kValueFlags)
        {
            if (flag.name == name)
            {
                auto value = take_value();
                if (!value)
                {
                    return std::nullopt;
                }
                options.*flag.slot = std::move(*value);
                matched = true;
                break;
            }
        }
        if (!matched)
        {
            error = std::format("unknown option '{}'", name);
            return std::nullopt;
        }
    }
    return options;
}

std::string usage_text()
{
    return R"(Usage: folio [options]

Converts the Markdown documents of a folder to PDF, EPUB or MOBI, skipping
documents whose artifact is already up to date.

Input and output:
  --source DIR                 Markdown folder (default: docs)
  --output-dir DIR             artifact root; files go to DIR/<format>/
  --temp-dir DIR               scratch directory (default: temp)
  --db-path FILE               state database
  --format pdf|epub|mobi       output format (default: pdf)

Rendering:
  --profile ID                 a4-print, a4-screen, kindle-basic,
                               kindle-large, kindle-paperwhite-11
  --margins SPEC               page margins, PDF only (default: "1in 0.75in")
  --max-diagram-width N|N%     diagram width bound (default: 1680)
  --max-diagram-height N|N%    diagram height bound (default: 2240)
  --plantuml-server URL        PlantUML render server
  --author NAME                e-book author metadata
  --language CODE              e-book language metadata (default: en)

Execution:
  --max-workers N              parallel workers (default: 4)
  --no-parallel                convert one document at a time
  --isolation process|thread   worker isolation (default: process)
  --force                      reconvert even when up to date
  --save-html                  keep the styled HTML in <output>/html/
  --save-html-bundle           keep HTML plus assets in <output>/html/<stem>/
  --no-cleanup                 keep the temp directory
  --skip-dependency-check      do not look for external tools

Maintenance:
  --cleanup-db                 forget every converted document and exit
  --set-default KEY=VALUE      store a default in the state database
  --debug                      verbose logging
  --version                    print the version
  --help                       print this text
)";
}

} // namespace folio::app
