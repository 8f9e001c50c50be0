#include "engine/ConversionPipeline.hpp"

#include "engine/HtmlTemplate.hpp"
#include "engine/Margins.hpp"
#include "engine/MarkdownFilters.hpp"
#include "engine/StalenessOracle.hpp"
#include "utils/Digest.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <array>
#include <chrono>
#include <format>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace folio::engine
{

namespace
{

constexpr std::array<std::string_view, 9> kStageNames = {
    "loaded",   "filtered",    "diagrams-rendered",
    "images-embedded", "externalized", "templated",
    "produced", "state-saved", "failed",
};

constexpr std::array<std::string_view, 3> kOutcomeNames = {
    "converted",
    "skipped",
    "failed",
};

constexpr std::string_view kPaperwhiteProfile = "kindle-paperwhite-11";
constexpr std::string_view kPrintProfile = "a4-print";

[[noreturn]] void fail(std::string message)
{
    throw std::runtime_error(std::move(message));
}

std::int64_t unix_now()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

std::string_view to_string(Stage stage) noexcept
{
    return kStageNames[static_cast<std::size_t>(stage)];
}

std::string_view to_string(OutcomeKind kind) noexcept
{
    return kOutcomeNames[static_cast<std::size_t>(kind)];
}

std::optional<Stage> parse_stage(std::string_view text)
{
    for (std::size_t i = 0; i < kStageNames.size(); ++i)
    {
        if (kStageNames[i] == text)
        {
            return static_cast<Stage>(i);
        }
    }
    return std::nullopt;
}

std::optional<OutcomeKind> parse_outcome_kind(std::string_view text)
{
    for (std::size_t i = 0; i < kOutcomeNames.size(); ++i)
    {
        if (kOutcomeNames[i] == text)
        {
            return static_cast<OutcomeKind>(i);
        }
    }
    return std::nullopt;
}

std::filesystem::path artifact_path_for(ConversionSettings const &settings,
                                        std::filesystem::path const &source)
{
    return settings.artifact_dir() /
           std::format("{}.{}", source.stem().string(),
                       format_name(settings.format));
}

struct ConversionPipeline::Document
{
    std::filesystem::path source;
    std::string key;
    std::string stem;
    std::string source_digest;
    std::filesystem::path artifact;
    std::filesystem::path temp_dir;
    std::string title;
    Stage stage = Stage::Loaded;
};

ConversionPipeline::ConversionPipeline(WorkerContext &context)
    : context_(context)
{
}

DocumentOutcome ConversionPipeline::convert(std::filesystem::path const &source)
{
    auto const &settings = context_.settings();
    Document doc;
    doc.source = source;
    doc.key = source.filename().string();
    doc.stem = source.stem().string();
    doc.artifact = artifact_path_for(settings, source);
    try
    {
        auto text = folio::utils::read_text_file(source);
        if (!text)
        {
            fail(std::format("cannot read {}", source.string()));
        }
        doc.source_digest = folio::utils::sha256_bytes(*text);

        auto record = context_.store().get_document(doc.key);
        std::error_code ec;
        bool const artifact_exists = std::filesystem::exists(doc.artifact, ec);
        auto const reason =
            staleness_reason(record, doc.source_digest, artifact_exists,
                             context_.fingerprint(), settings.force);
        if (reason == StalenessReason::UpToDate)
        {
            FOLIO_LOG_INFO("skipping {}: {} is up to date", doc.key,
                           doc.artifact.filename().string());
            return DocumentOutcome{doc.key, OutcomeKind::Skipped,
                                   std::string(describe(reason)), Stage::Loaded};
        }
        FOLIO_LOG_INFO("converting {} ({})", doc.key, describe(reason));

        doc.temp_dir = settings.temp_dir / doc.stem;
        if (!folio::utils::ensure_directory(doc.temp_dir))
        {
            fail(std::format("cannot create {}", doc.temp_dir.string()));
        }
        doc.title = extract_title(*text, source);

        doc.stage = Stage::Filtered;
        std::string markdown = std::move(*text);
        if (settings.profile == kPrintProfile)
        {
            markdown = filter_print_sections(markdown);
        }
        markdown =
            process_page_breaks(markdown, settings.format == OutputFormat::Pdf);

        doc.stage = Stage::DiagramsRendered;
        markdown = render_diagrams(doc, markdown);

        doc.stage = Stage::ImagesEmbedded;
        auto embedded =
            embed_local_images(markdown, source.parent_path(), doc.temp_dir);
        auto const temp_markdown = doc.temp_dir / ("temp_" + doc.key);
        if (!folio::utils::write_file_atomic(temp_markdown, embedded.markdown))
        {
            fail(std::format("cannot write {}", temp_markdown.string()));
        }

        produce(doc, temp_markdown);
        save_state(doc);
    }
    catch (std::exception const &ex)
    {
        FOLIO_LOG_ERROR("{} failed at {}: {}", doc.key, to_string(doc.stage),
                        ex.what());
        return DocumentOutcome::failed(doc.key, doc.stage, ex.what());
    }
    FOLIO_LOG_INFO("converted {} to {}", doc.key,
                   doc.artifact.filename().string());
    return DocumentOutcome{doc.key, OutcomeKind::Converted,
                           doc.artifact.string(), Stage::StateSaved};
}

std::string ConversionPipeline::render_diagrams(Document &doc,
                                                std::string const &markdown)
{
    auto blocks = find_diagram_blocks(markdown);
    if (blocks.empty())
    {
        return markdown;
    }
    std::vector<std::string> replacements;
    replacements.reserve(blocks.size());
    int mermaid_count = 0;
    int plantuml_count = 0;
    for (auto const &block : blocks)
    {
        bool const mermaid = block.dialect == DiagramDialect::Mermaid;
        int const index = mermaid ? ++mermaid_count : ++plantuml_count;
        auto const output =
            doc.temp_dir / std::format("{}_{}_{}.png", doc.stem,
                                       mermaid ? "mermaid" : "plantuml", index);
        auto result = render_block(block, output);
        if (!result.ok())
        {
            fail(std::format("{} diagram {}: {}", dialect_name(block.dialect),
                             index, result.message));
        }
        std::error_code ec;
        auto absolute = std::filesystem::absolute(output, ec);
        replacements.push_back(std::format(
            "![{} diagram {}]({}){{width={}px}}", dialect_name(block.dialect),
            index, (ec ? output : absolute).generic_string(),
            result.display.width));
        FOLIO_LOG_DEBUG("{} diagram {} of {}: {}x{} shown at {}x{}",
                        dialect_name(block.dialect), index, doc.key,
                        result.raster.width, result.raster.height,
                        result.display.width, result.display.height);
    }
    return replace_blocks(markdown, blocks, replacements);
}

RenderResult ConversionPipeline::render_block(DiagramBlock const &block,
                                              std::filesystem::path const &output)
{
    if (block.dialect == DiagramDialect::PlantUml)
    {
        return context_.plantuml().render(block.source, output, block.directive);
    }
    auto result = context_.mermaid().render(block.source, output, block.directive);
    if (result.status == RenderStatus::RetryableError)
    {
        FOLIO_LOG_WARN("{}; relaunching the browser", result.message);
        context_.browser().close();
        result = context_.mermaid().render(block.source, output, block.directive);
    }
    return result;
}

void ConversionPipeline::produce(Document &doc,
                                 std::filesystem::path const &temp_markdown)
{
    if (!folio::utils::ensure_directory(doc.artifact.parent_path()))
    {
        fail(std::format("cannot create {}",
                         doc.artifact.parent_path().string()));
    }
    if (context_.settings().format == OutputFormat::Pdf)
    {
        produce_pdf(doc, temp_markdown);
    }
    else
    {
        produce_ebook(doc, temp_markdown);
    }
}

void ConversionPipeline::produce_pdf(Document &doc,
                                     std::filesystem::path const &temp_markdown)
{
    auto const &settings = context_.settings();

    doc.stage = Stage::Externalized;
    auto const html = doc.temp_dir / (doc.stem + ".html");
    if (auto tool = context_.externalizer().to_html(temp_markdown, html);
        !tool.ok)
    {
        fail(std::move(tool.message));
    }

    doc.stage = Stage::Templated;
    auto const externalized = folio::utils::read_text_file(html);
    if (!externalized)
    {
        fail(std::format("cannot read {}", html.string()));
    }
    auto const *profile = find_style_profile(settings.profile);
    if (profile == nullptr)
    {
        fail(std::format("unknown style profile '{}'", settings.profile));
    }
    std::string error;
    auto const margins = parse_margins(settings.margins, error);
    if (!margins)
    {
        fail(std::format("invalid margins '{}': {}", settings.margins, error));
    }
    auto const enhanced =
        apply_html_template(*externalized, *profile, *margins, doc.title);
    auto const enhanced_path = doc.temp_dir / ("enhanced_" + doc.stem + ".html");
    if (!folio::utils::write_file_atomic(enhanced_path, enhanced))
    {
        fail(std::format("cannot write {}", enhanced_path.string()));
    }
    if (settings.save_html)
    {
        auto const saved = settings.html_dir() / (doc.stem + ".html");
        if (!folio::utils::ensure_directory(settings.html_dir()) ||
            !folio::utils::write_file_atomic(saved, enhanced))
        {
            FOLIO_LOG_WARN("could not save HTML to {}", saved.string());
        }
    }
    if (settings.save_html_bundle)
    {
        if (!save_html_bundle(enhanced, settings.html_dir() / doc.stem,
                              doc.stem))
        {
            FOLIO_LOG_WARN("could not save the HTML bundle for {}", doc.key);
        }
    }

    doc.stage = Stage::Produced;
    PdfOptions options;
    options.margin_top_cm = margins->top.to_cm();
    options.margin_right_cm = margins->right.to_cm();
    options.margin_bottom_cm = margins->bottom.to_cm();
    options.margin_left_cm = margins->left.to_cm();
    std::vector<std::uint8_t> pdf;
    try
    {
        pdf = context_.browser().produce(
            [&](BrowserPage &page)
            {
                page.load_file(enhanced_path);
                return page.print_pdf(options);
            });
    }
    catch (BrowserError const &ex)
    {
        fail(std::format("PDF production failed: {}", ex.what()));
    }
    if (pdf.empty())
    {
        fail("PDF production returned no data");
    }
    if (!folio::utils::write_file_atomic(doc.artifact, pdf))
    {
        fail(std::format("cannot write {}", doc.artifact.string()));
    }
}

void ConversionPipeline::produce_ebook(
    Document &doc, std::filesystem::path const &temp_markdown)
{
    auto const &settings = context_.settings();

    doc.stage = Stage::Externalized;
    EpubMetadata metadata;
    metadata.title = doc.title;
    metadata.author = settings.author;
    metadata.language = settings.language;
    if (settings.profile == kPaperwhiteProfile)
    {
        auto const css = doc.temp_dir / "kindle_paperwhite_11.css";
        if (!folio::utils::write_file_atomic(css, paperwhite_stylesheet()))
        {
            fail(std::format("cannot write {}", css.string()));
        }
        metadata.stylesheet = css;
    }
    auto const epub = doc.temp_dir / (doc.stem + ".epub");
    if (auto tool = context_.externalizer().to_epub(temp_markdown, epub, metadata);
        !tool.ok)
    {
        fail(std::move(tool.message));
    }

    // The stylesheet travels inside the container; nothing to template.
    doc.stage = Stage::Templated;

    doc.stage = Stage::Produced;
    if (settings.format == OutputFormat::Epub)
    {
        std::error_code ec;
        std::filesystem::copy_file(
            epub, doc.artifact,
            std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            fail(std::format("cannot write {}: {}", doc.artifact.string(),
                             ec.message()));
        }
        return;
    }
    if (auto tool = context_.packager().epub_to_mobi(epub, doc.artifact);
        !tool.ok)
    {
        fail(std::move(tool.message));
    }
}

void ConversionPipeline::save_state(Document &doc)
{
    doc.stage = Stage::StateSaved;
    auto const artifact_digest = folio::utils::sha256_file(doc.artifact);
    if (!artifact_digest)
    {
        fail(std::format("artifact {} unreadable after production",
                         doc.artifact.string()));
    }
    folio::storage::DocumentRecord record;
    record.key = doc.key;
    record.source_digest = doc.source_digest;
    record.artifact_digest = *artifact_digest;
    record.fingerprint = context_.fingerprint();
    record.artifact_path = doc.artifact.string();
    record.converted_at = unix_now();
    if (!context_.store().upsert_document(record))
    {
        fail(std::format("cannot record state for {}", doc.key));
    }
}

} // namespace folio::engine
