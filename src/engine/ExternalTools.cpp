#include "engine/ExternalTools.hpp"

#include "utils/Log.hpp"
#include "utils/Process.hpp"

#include <format>
#include <utility>
#include <vector>

namespace folio::engine
{

namespace
{

constexpr std::size_t kMaxReportedOutput = 2000;

ToolResult run_tool(std::vector<std::string> const &argv,
                    std::filesystem::path const &expected_output,
                    std::chrono::milliseconds timeout)
{
    FOLIO_LOG_DEBUG("running {}", argv.front());
    auto result = folio::utils::run_command(argv, {}, timeout);
    if (result.timed_out)
    {
        return ToolResult::failure(std::format(
            "{} timed out after {} ms", argv.front(), timeout.count()));
    }
    if (result.cancelled)
    {
        return ToolResult::failure(
            std::format("{} cancelled by shutdown", argv.front()));
    }
    if (!result.launched)
    {
        return ToolResult::failure(
            std::format("{} could not be started", argv.front()));
    }
    if (result.exit_code != 0)
    {
        auto output = result.output;
        if (output.size() > kMaxReportedOutput)
        {
            output.resize(kMaxReportedOutput);
        }
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
        {
            output.pop_back();
        }
        return ToolResult::failure(std::format("{} failed (exit {}): {}",
                                               argv.front(), result.exit_code,
                                               output));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(expected_output, ec))
    {
        return ToolResult::failure(std::format(
            "{} produced no output at {}", argv.front(),
            expected_output.string()));
    }
    return ToolResult::success();
}

} // namespace

PandocExternalizer::PandocExternalizer(std::string program,
                                       std::chrono::milliseconds timeout)
    : program_(std::move(program)), timeout_(timeout)
{
}

ToolResult PandocExternalizer::to_html(std::filesystem::path const &markdown,
                                       std::filesystem::path const &html)
{
    return run_tool({program_, markdown.string(), "-o", html.string(),
                     "--standalone", "--self-contained", "--css",
                     "data:text/css,"},
                    html, timeout_);
}

ToolResult PandocExternalizer::to_epub(std::filesystem::path const &markdown,
                                       std::filesystem::path const &epub,
                                       EpubMetadata const &metadata)
{
    std::vector<std::string> argv = {
        program_,
        markdown.string(),
        "-o",
        epub.string(),
        "--standalone",
        "--self-contained",
        "--metadata=title:" + metadata.title,
        "--metadata=author:" + metadata.author,
        "--metadata=language:" + metadata.language,
        "--toc",
        "--toc-depth=3",
    };
    if (metadata.stylesheet)
    {
        argv.emplace_back("--css");
        argv.push_back(metadata.stylesheet->string());
    }
    return run_tool(argv, epub, timeout_);
}

EbookConvertPackager::EbookConvertPackager(std::string program,
                                           std::chrono::milliseconds timeout)
    : program_(std::move(program)), timeout_(timeout)
{
}

ToolResult EbookConvertPackager::epub_to_mobi(std::filesystem::path const &epub,
                                              std::filesystem::path const &mobi)
{
    return run_tool({program_, epub.string(), mobi.string(),
                     "--mobi-file-type", "both", "--personal-doc",
                     "--no-inline-toc"},
                    mobi, timeout_);
}

} // namespace folio::engine
