#include "TestDoubles.hpp"
#include "app/SettingsLoader.hpp"

#include <map>
#include <string>

#include <doctest/doctest.h>

using folio::app::CommandLineOptions;
using folio::app::SettingsLoader;

namespace
{

SettingsLoader loader_with(std::map<std::string, std::string> env)
{
    return SettingsLoader(
        [env = std::move(env)](char const *name) -> std::optional<std::string>
        {
            auto it = env.find(name);
            if (it == env.end())
            {
                return std::nullopt;
            }
            return it->second;
        });
}

} // namespace

TEST_CASE("defaults apply when nothing is configured")
{
    std::string error;
    CommandLineOptions cli;
    cli.db_path = "state.db";
    auto settings = loader_with({}).load(cli, nullptr, error);
    REQUIRE(settings);
    CHECK(settings->format == folio::engine::OutputFormat::Pdf);
    CHECK(settings->profile == "a4-print");
    CHECK(settings->margins == "1in 0.75in");
    CHECK(settings->max_workers == 4);
    CHECK(settings->parallel);
    CHECK(settings->cleanup);
    CHECK(settings->isolation == folio::engine::IsolationMode::Process);
    CHECK(settings->db_path == "state.db");
}

TEST_CASE("stored defaults, environment and flags layer in that order")
{
    folio::test::ScratchDir scratch("settings");
    folio::storage::Database store(scratch / "state.db");
    REQUIRE(store.is_valid());
    std::string error;
    REQUIRE(folio::app::persist_default(store, "author", "Stored Author", error));
    REQUIRE(folio::app::persist_default(store, "sourceDir", "stored-docs", error));
    REQUIRE(folio::app::persist_default(store, "maxDiagramWidth", "1200", error));

    auto loader = loader_with({{"FOLIO_SOURCE_DIR", "env-docs"},
                               {"FOLIO_MAX_DIAGRAM_WIDTH", "80%"}});
    CommandLineOptions cli;
    cli.db_path = (scratch / "state.db").string();
    auto settings = loader.load(cli, &store, error);
    REQUIRE(settings);
    CHECK(settings->author == "Stored Author");
    CHECK(settings->source_dir == "env-docs");
    REQUIRE(std::holds_alternative<folio::engine::PercentOf>(
        settings->max_width));

    cli.source = "cli-docs";
    cli.max_diagram_width = "900";
    settings = loader.load(cli, &store, error);
    REQUIRE(settings);
    CHECK(settings->source_dir == "cli-docs");
    REQUIRE(std::holds_alternative<folio::engine::Pixels>(settings->max_width));
    CHECK(std::get<folio::engine::Pixels>(settings->max_width).value == 900u);
}

TEST_CASE("e-reader formats default to an e-reader profile")
{
    std::string error;
    CommandLineOptions cli;
    cli.db_path = "state.db";
    cli.format = "mobi";
    auto settings = loader_with({}).load(cli, nullptr, error);
    REQUIRE(settings);
    CHECK(settings->profile == "kindle-basic");

    cli.profile = "a4-print";
    CHECK_FALSE(loader_with({}).load(cli, nullptr, error));
    CHECK(error == "style profile 'a4-print' cannot produce mobi");
}

TEST_CASE("invalid values are rejected before any conversion")
{
    auto loader = loader_with({});
    std::string error;
    CommandLineOptions cli;
    cli.db_path = "state.db";

    auto bad_format = cli;
    bad_format.format = "docx";
    CHECK_FALSE(loader.load(bad_format, nullptr, error));
    CHECK(error.find("unknown format 'docx'") != std::string::npos);

    auto bad_profile = cli;
    bad_profile.profile = "letter";
    CHECK_FALSE(loader.load(bad_profile, nullptr, error));
    CHECK(error == "unknown style profile 'letter'");

    auto bad_margins = cli;
    bad_margins.margins = "5in";
    CHECK_FALSE(loader.load(bad_margins, nullptr, error));
    CHECK(error.starts_with("invalid margins '5in'"));

    auto bad_workers = cli;
    bad_workers.max_workers = "0";
    CHECK_FALSE(loader.load(bad_workers, nullptr, error));
    CHECK(error.starts_with("--max-workers expects a positive integer"));

    auto bad_isolation = cli;
    bad_isolation.isolation = "fiber";
    CHECK_FALSE(loader.load(bad_isolation, nullptr, error));

    auto env_loader = loader_with({{"FOLIO_MAX_DIAGRAM_HEIGHT", "tall"}});
    CHECK_FALSE(env_loader.load(cli, nullptr, error));
    CHECK(error.starts_with("FOLIO_MAX_DIAGRAM_HEIGHT: "));

    auto huge_loader =
        loader_with({{"FOLIO_MAX_DIAGRAM_WIDTH", "4000000000"}});
    CHECK_FALSE(huge_loader.load(cli, nullptr, error));
    CHECK(error.find("invalid maxDiagramWidth '4000000000'") !=
          std::string::npos);
}

TEST_CASE("stored values that no longer parse are ignored")
{
    folio::test::ScratchDir scratch("settings-bad");
    folio::storage::Database store(scratch / "state.db");
    REQUIRE(store.is_valid());
    REQUIRE(store.set_setting("maxDiagramHeight", "-3"));

    std::string error;
    CommandLineOptions cli;
    cli.db_path = "state.db";
    auto settings = loader_with({}).load(cli, &store, error);
    REQUIRE(settings);
    REQUIRE(std::holds_alternative<folio::engine::Pixels>(settings->max_height));
    CHECK(std::get<folio::engine::Pixels>(settings->max_height).value ==
          folio::engine::kDefaultPageHeightPx);
}

TEST_CASE("persist_default validates keys and values")
{
    folio::test::ScratchDir scratch("settings-persist");
    folio::storage::Database store(scratch / "state.db");
    REQUIRE(store.is_valid());
    std::string error;
    CHECK_FALSE(folio::app::persist_default(store, "colour", "red", error));
    CHECK(error == "unknown setting 'colour'");
    CHECK_FALSE(
        folio::app::persist_default(store, "maxDiagramWidth", "wide", error));
    CHECK_FALSE(store.get_setting("maxDiagramWidth"));
}

TEST_CASE("database path and debug resolution")
{
    CommandLineOptions cli;
    auto loader = loader_with({{"FOLIO_DB_PATH", "/var/lib/folio/state.db"},
                               {"FOLIO_DEBUG", "yes"}});
    CHECK(loader.resolve_db_path(cli) == "/var/lib/folio/state.db");
    CHECK(loader.debug_requested(cli));
    cli.db_path = "mine.db";
    CHECK(loader.resolve_db_path(cli) == "mine.db");
    CHECK_FALSE(loader_with({}).debug_requested(CommandLineOptions{}));
}
