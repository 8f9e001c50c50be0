#include "TestDoubles.hpp"
#include "engine/BatchOrchestrator.hpp"
#include "utils/Shutdown.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace folio::engine;

namespace
{

// Six documents, one of which always fails to externalize.
std::vector<std::filesystem::path> write_batch(ConversionSettings const &settings)
{
    for (int i = 1; i <= 6; ++i)
    {
        auto body = std::format("# Chapter {}\n\nText of chapter {}.\n", i, i);
        if (i == 4)
        {
            body += "FAIL-EXTERNALIZE\n";
        }
        folio::test::write_document(settings, std::format("chapter{}.md", i),
                                    body);
    }
    return discover_documents(settings.source_dir);
}

void check_first_run(BatchSummary const &summary)
{
    CHECK(summary.converted == 5);
    CHECK(summary.failed == 1);
    CHECK(summary.skipped == 0);
    CHECK(summary.total() == 6);
    REQUIRE(summary.outcomes.size() == 6);
    for (std::size_t i = 0; i < summary.outcomes.size(); ++i)
    {
        CHECK(summary.outcomes[i].key == std::format("chapter{}.md", i + 1));
    }
    CHECK(summary.outcomes[3].kind == OutcomeKind::Failed);
    CHECK(summary.outcomes[3].stage == Stage::Externalized);
}

void check_second_run(BatchSummary const &summary)
{
    CHECK(summary.skipped == 5);
    CHECK(summary.failed == 1);
    CHECK(summary.converted == 0);
}

} // namespace

TEST_CASE("discover_documents lists Markdown files except the README")
{
    folio::test::ScratchDir scratch("discover");
    auto settings = folio::test::scratch_settings(scratch);
    folio::test::write_document(settings, "b.md", "b");
    folio::test::write_document(settings, "a.md", "a");
    folio::test::write_document(settings, "README.md", "readme");
    folio::test::write_document(settings, "notes.txt", "notes");
    REQUIRE(folio::utils::ensure_directory(settings.source_dir / "nested.md"));

    auto documents = discover_documents(settings.source_dir);
    REQUIRE(documents.size() == 2);
    CHECK(documents[0].filename() == "a.md");
    CHECK(documents[1].filename() == "b.md");

    CHECK(discover_documents(scratch / "absent").empty());
}

TEST_CASE("worker count is bounded by the batch and the switches")
{
    ConversionSettings settings;
    settings.max_workers = 4;
    BatchOrchestrator parallel(settings, folio::test::fake_worker_services());
    CHECK(parallel.worker_count(10) == 4);
    CHECK(parallel.worker_count(3) == 3);
    CHECK(parallel.worker_count(1) == 1);
    CHECK(parallel.worker_count(0) == 1);

    settings.parallel = false;
    BatchOrchestrator sequential(settings, folio::test::fake_worker_services());
    CHECK(sequential.worker_count(10) == 1);
}

TEST_CASE("outcomes survive the worker wire format")
{
    DocumentOutcome outcome = DocumentOutcome::failed(
        "quote\"d.md", Stage::DiagramsRendered, "line one\nline \"two\"");
    auto line = encode_outcome(7, outcome);
    CHECK(line.find('\n') == std::string::npos);

    auto decoded = decode_outcome(line);
    REQUIRE(decoded);
    CHECK(decoded->first == 7);
    CHECK(decoded->second.key == outcome.key);
    CHECK(decoded->second.kind == OutcomeKind::Failed);
    CHECK(decoded->second.stage == Stage::DiagramsRendered);
    CHECK(decoded->second.message == outcome.message);

    CHECK_FALSE(decode_outcome("not json"));
    CHECK_FALSE(decode_outcome(R"({"index":1,"key":"a.md"})"));
    CHECK_FALSE(decode_outcome(
        R"({"index":1,"key":"a.md","kind":"odd","stage":"loaded","message":""})"));
}

TEST_CASE("sequential batches convert, then skip")
{
    folio::test::ScratchDir scratch("batch-inline");
    auto settings = folio::test::scratch_settings(scratch);
    settings.parallel = false;
    auto documents = write_batch(settings);

    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto first = orchestrator.run(documents);
    CHECK(first.workers == 1);
    check_first_run(first);
    CHECK(std::filesystem::exists(settings.output_dir / "pdf" / "chapter6.pdf"));

    check_second_run(orchestrator.run(documents));
}

TEST_CASE("thread workers produce the same summary as a sequential run")
{
    folio::test::ScratchDir scratch("batch-threads");
    auto settings = folio::test::scratch_settings(scratch);
    settings.isolation = IsolationMode::Thread;
    settings.max_workers = 4;
    auto documents = write_batch(settings);

    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto first = orchestrator.run(documents);
    CHECK(first.workers == 4);
    check_first_run(first);
    check_second_run(orchestrator.run(documents));
}

TEST_CASE("process workers produce the same summary as a sequential run")
{
    folio::test::ScratchDir scratch("batch-processes");
    auto settings = folio::test::scratch_settings(scratch);
    settings.isolation = IsolationMode::Process;
    settings.max_workers = 4;
    auto documents = write_batch(settings);

    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto first = orchestrator.run(documents);
    CHECK(first.workers == 4);
    check_first_run(first);
    for (int i : {1, 2, 3, 5, 6})
    {
        CHECK(std::filesystem::exists(settings.output_dir / "pdf" /
                                      std::format("chapter{}.pdf", i)));
    }
    check_second_run(orchestrator.run(documents));
}

TEST_CASE("a worker process that dies fails only the document it held")
{
    folio::test::ScratchDir scratch("batch-crash");
    auto settings = folio::test::scratch_settings(scratch);
    settings.isolation = IsolationMode::Process;
    settings.max_workers = 2;
    for (int i = 1; i <= 5; ++i)
    {
        folio::test::write_document(
            settings, std::format("part{}.md", i),
            std::format("# Part {}\n{}\n", i, i == 2 ? "KILL-WORKER" : "ok"));
    }
    auto documents = discover_documents(settings.source_dir);

    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto summary = orchestrator.run(documents);
    CHECK(summary.total() == 5);
    CHECK(summary.converted == 4);
    CHECK(summary.failed == 1);
    REQUIRE(summary.outcomes.size() == 5);
    auto const &killed = summary.outcomes[1];
    CHECK(killed.key == "part2.md");
    CHECK(killed.kind == OutcomeKind::Failed);
    CHECK(killed.stage == Stage::Failed);
    CHECK(killed.message.find("killed by signal") != std::string::npos);
}

TEST_CASE("a shutdown request cancels undispatched documents")
{
    folio::test::ScratchDir scratch("batch-cancel");
    auto settings = folio::test::scratch_settings(scratch);
    settings.parallel = false;
    auto documents = write_batch(settings);

    folio::runtime::request_shutdown();
    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto summary = orchestrator.run(documents);
    folio::runtime::reset_shutdown();

    CHECK(summary.failed == 6);
    REQUIRE(summary.outcomes.size() == 6);
    CHECK(summary.outcomes[0].message == "cancelled");
}

TEST_CASE("a worker whose state store cannot open fails its documents")
{
    folio::test::ScratchDir scratch("batch-setup");
    auto settings = folio::test::scratch_settings(scratch);
    settings.parallel = false;
    auto documents = write_batch(settings);
    settings.db_path = scratch / "docs" / "chapter1.md" / "state.db";

    BatchOrchestrator orchestrator(settings, folio::test::fake_worker_services());
    auto summary = orchestrator.run(documents);
    CHECK(summary.failed == 6);
    CHECK(summary.outcomes[0].message.starts_with("worker setup failed: "));
}
