#include "TestDoubles.hpp"
#include "engine/ConversionPipeline.hpp"
#include "utils/Digest.hpp"

#include <string>

#include <doctest/doctest.h>

using namespace folio::engine;

namespace
{

std::string const kGuide = "# User Guide\n"
                           "\n"
                           "## Table of Contents\n"
                           "- [Setup](#setup)\n"
                           "\n"
                           "## Setup\n"
                           "Install it.\n"
                           "<!-- page-break -->\n"
                           "## Usage\n"
                           "Run it.\n";

struct PipelineHarness
{
    folio::test::ScratchDir scratch{"pipeline"};
    ConversionSettings settings = folio::test::scratch_settings(scratch);
    std::shared_ptr<folio::test::FakeBrowserState> browser =
        std::make_shared<folio::test::FakeBrowserState>();
    std::shared_ptr<folio::test::FakeServiceState> service =
        std::make_shared<folio::test::FakeServiceState>();
    std::shared_ptr<folio::test::ToolCounters> tools =
        std::make_shared<folio::test::ToolCounters>();

    DocumentOutcome convert(std::string const &name)
    {
        auto services = folio::test::fake_worker_services(tools);
        services.browser = folio::test::fake_engine_factory(browser);
        services.diagram_client = folio::test::fake_client_factory(service);
        WorkerContext context(settings, services);
        ConversionPipeline pipeline(context);
        return pipeline.convert(settings.source_dir / name);
    }

    std::optional<folio::storage::DocumentRecord> record(std::string const &key)
    {
        folio::storage::Database db(settings.db_path);
        return db.get_document(key);
    }

    std::filesystem::path temp_file(std::string const &stem,
                                    std::string const &name) const
    {
        return settings.temp_dir / stem / name;
    }
};

} // namespace

TEST_CASE("a converted document is skipped until something changes")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "guide.md", kGuide);

    auto first = h.convert("guide.md");
    REQUIRE(first.kind == OutcomeKind::Converted);
    CHECK(first.stage == Stage::StateSaved);
    CHECK(first.key == "guide.md");

    auto artifact = h.settings.output_dir / "pdf" / "guide.pdf";
    REQUIRE(std::filesystem::exists(artifact));
    CHECK(folio::utils::read_text_file(artifact)->starts_with("%PDF"));
    CHECK(h.browser->loaded_files.size() == 1);

    auto record = h.record("guide.md");
    REQUIRE(record);
    CHECK(record->source_digest == folio::utils::sha256_bytes(kGuide));
    CHECK(record->artifact_digest == folio::utils::sha256_file(artifact));
    CHECK(record->artifact_path == artifact.string());

    auto second = h.convert("guide.md");
    CHECK(second.kind == OutcomeKind::Skipped);
    CHECK(second.message == "up to date");
    CHECK(h.tools->html_runs.load() == 1);
}

TEST_CASE("source edits, missing artifacts and --force all reconvert")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "guide.md", kGuide);
    REQUIRE(h.convert("guide.md").kind == OutcomeKind::Converted);

    folio::test::write_document(h.settings, "guide.md", kGuide + "More.\n");
    CHECK(h.convert("guide.md").kind == OutcomeKind::Converted);
    CHECK(h.convert("guide.md").kind == OutcomeKind::Skipped);

    std::filesystem::remove(h.settings.output_dir / "pdf" / "guide.pdf");
    CHECK(h.convert("guide.md").kind == OutcomeKind::Converted);

    h.settings.force = true;
    CHECK(h.convert("guide.md").kind == OutcomeKind::Converted);
    CHECK(h.tools->html_runs.load() == 4);
}

TEST_CASE("changing the margins invalidates PDF artifacts")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "guide.md", kGuide);
    h.settings.margins = "1in 0.75in";
    REQUIRE(h.convert("guide.md").kind == OutcomeKind::Converted);
    CHECK(h.convert("guide.md").kind == OutcomeKind::Skipped);

    h.settings.margins = "2in 0.75in";
    CHECK(h.convert("guide.md").kind == OutcomeKind::Converted);
    CHECK(h.convert("guide.md").kind == OutcomeKind::Skipped);
}

TEST_CASE("print filtering and page breaks reach the templated HTML")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "guide.md", kGuide);
    h.settings.save_html = true;
    REQUIRE(h.convert("guide.md").kind == OutcomeKind::Converted);

    auto processed = folio::utils::read_text_file(
        h.temp_file("guide", "temp_guide.md"));
    REQUIRE(processed);
    CHECK(processed->find("Table of Contents") == std::string::npos);
    CHECK(processed->find(kPageBreakDiv) != std::string::npos);

    auto enhanced = folio::utils::read_text_file(
        h.temp_file("guide", "enhanced_guide.html"));
    REQUIRE(enhanced);
    CHECK(enhanced->find("<title>User Guide</title>") != std::string::npos);
    CHECK(std::filesystem::exists(h.settings.output_dir / "html" /
                                  "guide.html"));
    REQUIRE(h.browser->loaded_files.size() == 1);
    CHECK(h.browser->loaded_files[0].filename() == "enhanced_guide.html");
}

TEST_CASE("a failing document leaves no record and keeps the previous one")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "good.md", "# Good\n");
    folio::test::write_document(h.settings, "bad.md",
                                "# Bad\nFAIL-EXTERNALIZE\n");

    auto bad = h.convert("bad.md");
    CHECK(bad.kind == OutcomeKind::Failed);
    CHECK(bad.stage == Stage::Externalized);
    CHECK(bad.message.find("pandoc failed") != std::string::npos);
    CHECK_FALSE(h.record("bad.md"));
    CHECK_FALSE(std::filesystem::exists(h.settings.output_dir / "pdf" /
                                        "bad.pdf"));

    REQUIRE(h.convert("good.md").kind == OutcomeKind::Converted);
    auto before = h.record("good.md");
    REQUIRE(before);

    folio::test::write_document(h.settings, "good.md",
                                "# Good\nFAIL-EXTERNALIZE\n");
    auto retry = h.convert("good.md");
    CHECK(retry.kind == OutcomeKind::Failed);
    auto after = h.record("good.md");
    REQUIRE(after);
    CHECK(after->source_digest == before->source_digest);

    // Still stale, so a fixed source converts again.
    folio::test::write_document(h.settings, "good.md", "# Good\nfixed\n");
    CHECK(h.convert("good.md").kind == OutcomeKind::Converted);
}

TEST_CASE("diagrams are rendered and referenced with a display width")
{
    PipelineHarness h;
    folio::test::write_document(h.settings, "flows.md",
                                "# Flows\n"
                                "```mermaid\ngraph TD\n  A-->B\n```\n"
                                "<!-- scale:50% -->\n"
                                "```plantuml\n@startuml\nA -> B\n@enduml\n```\n"
                                "```mermaid\ngraph LR\n  C-->D\n```\n");
    auto outcome = h.convert("flows.md");
    REQUIRE(outcome.kind == OutcomeKind::Converted);

    CHECK(std::filesystem::exists(h.temp_file("flows", "flows_mermaid_1.png")));
    CHECK(std::filesystem::exists(h.temp_file("flows", "flows_mermaid_2.png")));
    CHECK(std::filesystem::exists(h.temp_file("flows", "flows_plantuml_1.png")));
    CHECK(h.service->calls == 1);

    auto processed =
        folio::utils::read_text_file(h.temp_file("flows", "temp_flows.md"));
    REQUIRE(processed);
    CHECK(processed->find("```mermaid") == std::string::npos);
    CHECK(processed->find("![Mermaid diagram 1](") != std::string::npos);
    CHECK(processed->find("![Mermaid diagram 2](") != std::string::npos);
    CHECK(processed->find("{width=1680px}") != std::string::npos);
    CHECK(processed->find("![PlantUML diagram 1](") != std::string::npos);
    CHECK(processed->find("{width=840px}") != std::string::npos);
    CHECK(processed->find("scale:50%") == std::string::npos);
}

TEST_CASE("a Mermaid syntax error fails the document at the diagram stage")
{
    PipelineHarness h;
    h.browser->syntax_error = true;
    folio::test::write_document(h.settings, "broken.md",
                                "```mermaid\ngraph TD\n  A-->\n```\n");
    auto outcome = h.convert("broken.md");
    CHECK(outcome.kind == OutcomeKind::Failed);
    CHECK(outcome.stage == Stage::DiagramsRendered);
    CHECK(outcome.message.find("Mermaid diagram 1") != std::string::npos);
    CHECK(outcome.message.find("Parse error on line 2") != std::string::npos);
    CHECK_FALSE(h.record("broken.md"));
}

TEST_CASE("a browser crash during a Mermaid render is retried once")
{
    PipelineHarness h;
    h.browser->crash_renders = 1;
    folio::test::write_document(h.settings, "flow.md",
                                "```mermaid\ngraph TD\n  A-->B\n```\n");
    auto outcome = h.convert("flow.md");
    CHECK(outcome.kind == OutcomeKind::Converted);
    CHECK(h.browser->starts == 2);

    h.browser->crash_renders = 2;
    h.settings.force = true;
    auto twice = h.convert("flow.md");
    CHECK(twice.kind == OutcomeKind::Failed);
    CHECK(twice.stage == Stage::DiagramsRendered);
}

TEST_CASE("EPUB output carries metadata and drops page breaks")
{
    PipelineHarness h;
    h.settings.format = OutputFormat::Epub;
    h.settings.profile = "kindle-paperwhite-11";
    h.settings.author = "Ada";
    folio::test::write_document(h.settings, "guide.md", kGuide);

    auto outcome = h.convert("guide.md");
    REQUIRE(outcome.kind == OutcomeKind::Converted);
    auto epub = folio::utils::read_text_file(h.settings.output_dir / "epub" /
                                             "guide.epub");
    REQUIRE(epub);
    CHECK(epub->starts_with("EPUB title=User Guide author=Ada css=yes"));
    CHECK(epub->find("page-break") == std::string::npos);
    // Only a4-print filters the table of contents.
    CHECK(epub->find("Table of Contents") != std::string::npos);
    CHECK(h.browser->starts == 0);
    CHECK(h.tools->html_runs.load() == 0);
}

TEST_CASE("MOBI output goes through the packager")
{
    PipelineHarness h;
    h.settings.format = OutputFormat::Mobi;
    h.settings.profile = "kindle-basic";
    folio::test::write_document(h.settings, "guide.md", kGuide);
    folio::test::write_document(h.settings, "stuck.md", "# Stuck\nFAIL-PACKAGE\n");

    auto outcome = h.convert("guide.md");
    REQUIRE(outcome.kind == OutcomeKind::Converted);
    CHECK(std::filesystem::exists(h.settings.output_dir / "mobi" / "guide.mobi"));
    CHECK(h.tools->mobi_runs.load() == 1);

    auto stuck = h.convert("stuck.md");
    CHECK(stuck.kind == OutcomeKind::Failed);
    CHECK(stuck.stage == Stage::Produced);
    CHECK(stuck.message.find("ebook-convert failed") != std::string::npos);
}

TEST_CASE("stage and outcome names round-trip")
{
    CHECK(to_string(Stage::DiagramsRendered) == "diagrams-rendered");
    CHECK(parse_stage("images-embedded") == Stage::ImagesEmbedded);
    CHECK_FALSE(parse_stage("rendered"));
    CHECK(to_string(OutcomeKind::Skipped) == "skipped");
    CHECK(parse_outcome_kind("failed") == OutcomeKind::Failed);
}
