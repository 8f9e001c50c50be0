#include "TestDoubles.hpp"
#include "app/Dependencies.hpp"
#include "engine/ExternalTools.hpp"

#include <chrono>
#include <string>

#include <doctest/doctest.h>

using namespace folio::engine;

namespace
{

std::string write_script(folio::test::ScratchDir const &scratch,
                         std::string const &name, std::string const &body)
{
    auto path = scratch / name;
    REQUIRE(folio::utils::write_file_atomic(path, "#!/bin/sh\n" + body));
    std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);
    return path.string();
}

} // namespace

TEST_CASE("externalizer outcomes follow the tool's exit status and output")
{
    folio::test::ScratchDir scratch("tools");
    auto markdown = scratch / "doc.md";
    REQUIRE(folio::utils::write_file_atomic(markdown, "# Doc\n"));

    PandocExternalizer copying(write_script(scratch, "ok.sh", "cp \"$1\" \"$3\"\n"));
    auto ok = copying.to_html(markdown, scratch / "doc.html");
    CHECK(ok.ok);
    CHECK(std::filesystem::exists(scratch / "doc.html"));

    PandocExternalizer failing(
        write_script(scratch, "fail.sh", "echo 'bad input' >&2\nexit 2\n"));
    auto failed = failing.to_html(markdown, scratch / "x.html");
    CHECK_FALSE(failed.ok);
    CHECK(failed.message.find("failed (exit 2): bad input") != std::string::npos);

    PandocExternalizer silent(write_script(scratch, "silent.sh", "exit 0\n"));
    auto empty = silent.to_epub(markdown, scratch / "doc.epub", {});
    CHECK_FALSE(empty.ok);
    CHECK(empty.message.find("produced no output") != std::string::npos);

    PandocExternalizer absent("folio-no-such-pandoc");
    auto missing = absent.to_html(markdown, scratch / "y.html");
    CHECK(missing.message == "folio-no-such-pandoc could not be started");
}

TEST_CASE("a hung tool fails the step once its deadline passes")
{
    folio::test::ScratchDir scratch("tools-hung");
    auto markdown = scratch / "doc.md";
    REQUIRE(folio::utils::write_file_atomic(markdown, "# Doc\n"));

    PandocExternalizer hung(write_script(scratch, "hung.sh", "sleep 30\n"),
                            std::chrono::milliseconds(300));
    auto result = hung.to_html(markdown, scratch / "doc.html");
    CHECK_FALSE(result.ok);
    CHECK(result.message.find("timed out after 300 ms") != std::string::npos);

    EbookConvertPackager stuck(write_script(scratch, "stuck.sh", "sleep 30\n"),
                               std::chrono::milliseconds(300));
    auto packaged = stuck.epub_to_mobi(scratch / "a.epub", scratch / "a.mobi");
    CHECK_FALSE(packaged.ok);
    CHECK(packaged.message.find("timed out") != std::string::npos);
}

TEST_CASE("packager reports a missing ebook-convert")
{
    folio::test::ScratchDir scratch("tools-mobi");
    EbookConvertPackager packager("folio-no-such-ebook-convert");
    auto result = packager.epub_to_mobi(scratch / "a.epub", scratch / "a.mobi");
    CHECK_FALSE(result.ok);
}

TEST_CASE("dependency checks follow the output format")
{
    ConversionSettings settings;
    auto nothing = [](std::string const &) { return false; };

    auto pdf = folio::app::check_dependencies(settings, false, nothing);
    std::vector<std::string> const pdf_tools = {"pandoc", "chromedriver"};
    CHECK(pdf.missing == pdf_tools);

    settings.format = OutputFormat::Epub;
    auto epub = folio::app::check_dependencies(settings, false, nothing);
    REQUIRE(epub.missing.size() == 1);
    CHECK(epub.missing[0] == "pandoc");
    auto epub_mermaid = folio::app::check_dependencies(settings, true, nothing);
    CHECK(epub_mermaid.missing.size() == 2);

    settings.format = OutputFormat::Mobi;
    auto mobi = folio::app::check_dependencies(settings, false, nothing);
    std::vector<std::string> const mobi_tools = {"pandoc", "ebook-convert"};
    CHECK(mobi.missing == mobi_tools);

    auto everything = [](std::string const &) { return true; };
    CHECK(folio::app::check_dependencies(settings, true, everything).ok());
}
