#include "app/ConverterMain.hpp"

#include "app/CommandLine.hpp"
#include "app/Dependencies.hpp"
#include "app/SettingsLoader.hpp"
#include "engine/BatchOrchestrator.hpp"
#include "engine/DiagramBlocks.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/StateStore.hpp"
#include "utils/Version.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace folio::app
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool uses_mermaid(std::vector<std::filesystem::path> const &documents)
{
    return std::any_of(documents.begin(), documents.end(),
                       [](std::filesystem::path const &document)
                       {
                           auto text = folio::utils::read_text_file(document);
                           if (!text)
                           {
                               return false;
                           }
                           auto blocks = folio::engine::find_diagram_blocks(*text);
                           return std::any_of(
                               blocks.begin(), blocks.end(),
                               [](folio::engine::DiagramBlock const &block)
                               {
                                   return block.dialect ==
                                          folio::engine::DiagramDialect::Mermaid;
                               });
                       });
}

int apply_set_defaults(folio::storage::Database &store,
                       CommandLineOptions const &cli)
{
    for (auto const &[key, value] : cli.set_defaults)
    {
        std::string error;
        if (!persist_default(store, key, value, error))
        {
            std::fprintf(stderr, "folio: %s\n", error.c_str());
            return kExitUsage;
        }
        folio::log::print_status("Stored default {} = {}", key, value);
    }
    return kExitOk;
}

int cleanup_database(folio::storage::Database &store)
{
    auto removed = store.delete_all_documents();
    if (!removed)
    {
        FOLIO_LOG_ERROR("failed to clear document records in {}",
                        store.path().string());
        return kExitFailure;
    }
    folio::log::print_status("Removed {} document record(s) from {}", *removed,
                             store.path().string());
    return kExitOk;
}

void remove_temp_dir(std::filesystem::path const &temp_dir)
{
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    if (ec)
    {
        FOLIO_LOG_WARN("could not remove {}: {}", temp_dir.string(),
                       ec.message());
        return;
    }
    FOLIO_LOG_DEBUG("removed {}", temp_dir.string());
}

void report_summary(folio::engine::BatchSummary const &summary)
{
    for (auto const &outcome : summary.outcomes)
    {
        if (outcome.kind == folio::engine::OutcomeKind::Failed)
        {
            folio::log::print_status("  failed  {} [{}]: {}", outcome.key,
                                     folio::engine::to_string(outcome.stage),
                                     outcome.message);
        }
    }
    folio::log::print_status(
        "Done: {} converted, {} skipped, {} failed ({} document(s), {} "
        "worker(s))",
        summary.converted, summary.skipped, summary.failed, summary.total(),
        summary.workers);
}

} // namespace

int converter_main(int argc, char *argv[])
{
    try
    {
        std::vector<std::string> args;
        for (int index = 1; index < argc; ++index)
        {
            if (argv[index] != nullptr)
            {
                args.emplace_back(argv[index]);
            }
        }

        std::string error;
        auto cli = parse_command_line(args, error);
        if (!cli)
        {
            std::fprintf(stderr, "folio: %s\n\n%s", error.c_str(),
                         usage_text().c_str());
            return kExitUsage;
        }
        if (cli->show_help)
        {
            folio::log::print_status("{}", usage_text());
            return kExitOk;
        }
        if (cli->show_version)
        {
            std::string_view const version = folio::version::kDisplayVersion;
            folio::log::print_status("{}", version);
            return kExitOk;
        }

        folio::runtime::install_signal_handlers();
        SettingsLoader loader;
        if (loader.debug_requested(*cli))
        {
            folio::log::set_threshold(folio::log::Level::Debug);
        }
        std::string_view const version = folio::version::kDisplayVersion;
        FOLIO_LOG_DEBUG("{} starting", version);

        auto db_path = loader.resolve_db_path(*cli);
        auto store = std::make_unique<folio::storage::Database>(db_path);
        if (!store->is_valid())
        {
            FOLIO_LOG_ERROR("cannot open state database {}", db_path.string());
            return kExitFailure;
        }

        if (!cli->set_defaults.empty())
        {
            return apply_set_defaults(*store, *cli);
        }
        if (cli->cleanup_db)
        {
            return cleanup_database(*store);
        }

        auto settings = loader.load(*cli, store.get(), error);
        if (!settings)
        {
            std::fprintf(stderr, "folio: %s\n", error.c_str());
            return kExitUsage;
        }
        // Workers open their own connections.
        store.reset();

        auto documents = folio::engine::discover_documents(settings->source_dir);
        if (documents.empty())
        {
            folio::log::print_status("No Markdown documents found in {}",
                                     settings->source_dir.string());
            return kExitOk;
        }

        if (!cli->skip_dependency_check)
        {
            auto report = check_dependencies(*settings, uses_mermaid(documents));
            if (!report.ok())
            {
                for (auto const &tool : report.missing)
                {
                    FOLIO_LOG_ERROR("required tool not found on PATH: {}", tool);
                }
                return kExitFailure;
            }
        }

        if (!folio::utils::ensure_directory(settings->artifact_dir()) ||
            !folio::utils::ensure_directory(settings->temp_dir))
        {
            FOLIO_LOG_ERROR("cannot create {} or {}",
                            settings->artifact_dir().string(),
                            settings->temp_dir.string());
            return kExitFailure;
        }

        folio::log::print_status(
            "Converting {} document(s) from {} to {} ({})", documents.size(),
            settings->source_dir.string(),
            folio::engine::format_name(settings->format), settings->profile);

        folio::engine::BatchOrchestrator orchestrator(
            *settings, folio::engine::default_worker_services(*settings));
        auto summary = orchestrator.run(documents);
        report_summary(summary);

        if (settings->cleanup)
        {
            remove_temp_dir(settings->temp_dir);
        }
        return summary.failed == 0 ? kExitOk : kExitFailure;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "folio failed: %s\n", ex.what());
    }
    return kExitFailure;
}

} // namespace folio::app
