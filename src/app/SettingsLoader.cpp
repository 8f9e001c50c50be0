#include "app/SettingsLoader.hpp"

#include "engine/Dimension.hpp"
#include "engine/Margins.hpp"
#include "engine/StyleProfiles.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <format>
#include <utility>

namespace folio::app
{

namespace
{

constexpr std::array<std::string_view, 10> kPersistableKeys = {
    "sourceDir",       "outputDir",        "tempDir",
    "plantumlServer",  "maxDiagramWidth",  "maxDiagramHeight",
    "chromedriver",    "browserBinary",    "author",
    "language",
};

struct EnvBinding
{
    char const *variable;
    std::string_view key;
};

// Environment variables that override a persistable key.
constexpr std::array<EnvBinding, 8> kEnvBindings = {{
    {"FOLIO_SOURCE_DIR", "sourceDir"},
    {"FOLIO_OUTPUT_DIR", "outputDir"},
    {"FOLIO_TEMP_DIR", "tempDir"},
    {"FOLIO_PLANTUML_SERVER", "plantumlServer"},
    {"FOLIO_MAX_DIAGRAM_WIDTH", "maxDiagramWidth"},
    {"FOLIO_MAX_DIAGRAM_HEIGHT", "maxDiagramHeight"},
    {"FOLIO_CHROMEDRIVER", "chromedriver"},
    {"FOLIO_BROWSER_BINARY", "browserBinary"},
}};

std::optional<std::string> process_environment(char const *name)
{
    auto value = std::getenv(name);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

bool is_truthy(std::string_view value)
{
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// Applies one key to the settings; false with `error` for a bad value.
bool apply_key(folio::engine::ConversionSettings &settings,
               std::string_view key, std::string const &value,
               std::string &error)
{
    if (key == "sourceDir")
    {
        settings.source_dir = value;
    }
    else if (key == "outputDir")
    {
        settings.output_dir = value;
    }
    else if (key == "tempDir")
    {
        settings.temp_dir = value;
    }
    else if (key == "plantumlServer")
    {
        settings.plantuml_server = value;
    }
    else if (key == "maxDiagramWidth" || key == "maxDiagramHeight")
    {
        auto dimension = folio::engine::parse_dimension(value);
        if (!dimension)
        {
            error = std::format("invalid {} '{}': expected pixels (1..{}) or "
                                "a percentage (up to {}%)",
                                key, value, folio::engine::kMaxDimensionPx,
                                folio::engine::kMaxDimensionPercent);
            return false;
        }
        (key == "maxDiagramWidth" ? settings.max_width : settings.max_height) =
            *dimension;
    }
    else if (key == "chromedriver")
    {
        settings.chromedriver = value;
    }
    else if (key == "browserBinary")
    {
        settings.browser_binary = value;
    }
    else if (key == "author")
    {
        settings.author = value;
    }
    else if (key == "language")
    {
        settings.language = value;
    }
    else
    {
        error = std::format("unknown setting '{}'", key);
        return false;
    }
    return true;
}

std::optional<std::size_t> parse_worker_count(std::string_view text)
{
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::span<std::string_view const> persistable_keys() noexcept
{
    return kPersistableKeys;
}

bool is_persistable_key(std::string_view key) noexcept
{
    return std::find(kPersistableKeys.begin(), kPersistableKeys.end(), key) !=
           kPersistableKeys.end();
}

SettingsLoader::SettingsLoader() : env_(process_environment) {}

SettingsLoader::SettingsLoader(EnvLookup env) : env_(std::move(env)) {}

std::filesystem::path
SettingsLoader::resolve_db_path(CommandLineOptions const &cli) const
{
    if (cli.db_path)
    {
        return *cli.db_path;
    }
    if (auto env = env_("FOLIO_DB_PATH"); env && !env->empty())
    {
        return *env;
    }
    return folio::utils::data_root() / "folio.db";
}

bool SettingsLoader::debug_requested(CommandLineOptions const &cli) const
{
    if (cli.debug)
    {
        return true;
    }
    auto env = env_("FOLIO_DEBUG");
    return env && is_truthy(*env);
}

std::optional<folio::engine::ConversionSettings>
SettingsLoader::load(CommandLineOptions const &cli,
                     folio::storage::Database const *store,
                     std::string &error) const
{
    folio::engine::ConversionSettings settings;
    settings.db_path = resolve_db_path(cli);

    if (store != nullptr && store->is_valid())
    {
        for (auto key : kPersistableKeys)
        {
            auto stored = store->get_setting(std::string(key));
            if (!stored)
            {
                continue;
            }
            std::string key_error;
            if (!apply_key(settings, key, *stored, key_error))
            {
                FOLIO_LOG_WARN("ignoring stored default: {}", key_error);
            }
        }
    }

    for (auto const &binding : kEnvBindings)
    {
        auto value = env_(binding.variable);
        if (!value || value->empty())
        {
            continue;
        }
        if (!apply_key(settings, binding.key, *value, error))
        {
            error = std::format("{}: {}", binding.variable, error);
            return std::nullopt;
        }
    }

    struct CliBinding
    {
        std::optional<std::string> const &value;
        std::string_view key;
    };
    CliBinding const cli_bindings[] = {
        {cli.source, "sourceDir"},
        {cli.output_dir, "outputDir"},
        {cli.temp_dir, "tempDir"},
        {cli.plantuml_server, "plantumlServer"},
        {cli.max_diagram_width, "maxDiagramWidth"},
        {cli.max_diagram_height, "maxDiagramHeight"},
        {cli.author, "author"},
        {cli.language, "language"},
    };
    for (auto const &binding : cli_bindings)
    {
        if (binding.value && !apply_key(settings, binding.key, *binding.value, error))
        {
            return std::nullopt;
        }
    }

    if (cli.format)
    {
        auto format = folio::engine::parse_output_format(*cli.format);
        if (!format)
        {
            error = std::format("unknown format '{}' (pdf, epub or mobi)",
                                *cli.format);
            return std::nullopt;
        }
        settings.format = *format;
    }

    settings.profile = cli.profile
                           ? *cli.profile
                           : std::string(folio::engine::default_profile_for(
                                 settings.format));
    auto const *profile = folio::engine::find_style_profile(settings.profile);
    if (profile == nullptr)
    {
        error = std::format("unknown style profile '{}'", settings.profile);
        return std::nullopt;
    }
    if (!profile->supports(settings.format))
    {
        error = std::format("style profile '{}' cannot produce {}",
                            settings.profile,
                            folio::engine::format_name(settings.format));
        return std::nullopt;
    }

    if (cli.margins)
    {
        settings.margins = *cli.margins;
    }
    std::string margin_error;
    if (!folio::engine::parse_margins(settings.margins, margin_error))
    {
        error = std::format("invalid margins '{}': {}", settings.margins,
                            margin_error);
        return std::nullopt;
    }

    if (cli.max_workers)
    {
        auto workers = parse_worker_count(*cli.max_workers);
        if (!workers)
        {
            error = std::format("--max-workers expects a positive integer, "
                                "got '{}'",
                                *cli.max_workers);
            return std::nullopt;
        }
        settings.max_workers = *workers;
    }
    if (cli.isolation)
    {
        if (*cli.isolation == "process")
        {
            settings.isolation = folio::engine::IsolationMode::Process;
        }
        else if (*cli.isolation == "thread")
        {
            settings.isolation = folio::engine::IsolationMode::Thread;
        }
        else
        {
            error = std::format("--isolation expects process or thread, got "
                                "'{}'",
                                *cli.isolation);
            return std::nullopt;
        }
    }

    settings.parallel = !cli.no_parallel;
    settings.force = cli.force;
    settings.save_html = cli.save_html;
    settings.save_html_bundle = cli.save_html_bundle;
    settings.cleanup = !cli.no_cleanup;
    return settings;
}

bool persist_default(folio::storage::Database &store, std::string const &key,
                     std::string const &value, std::string &error)
{
    if (!is_persistable_key(key))
    {
        error = std::format("unknown setting '{}'", key);
        return false;
    }
    folio::engine::ConversionSettings probe;
    if (!apply_key(probe, key, value, error))
    {
        return false;
    }
    if (!store.set_setting(key, value))
    {
        error = std::format("could not store '{}'", key);
        return false;
    }
    return true;
}

} // namespace folio::app
