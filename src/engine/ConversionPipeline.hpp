#pragma once

#include "engine/DiagramBlocks.hpp"
#include "engine/WorkerContext.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace folio::engine {

enum class Stage {
  Loaded,
  Filtered,
  DiagramsRendered,
  ImagesEmbedded,
  Externalized,
  Templated,
  Produced,
  StateSaved,
  Failed,
};

enum class OutcomeKind { Converted, Skipped, Failed };

// Result of one document. For failures `stage` names the stage that broke;
// otherwise the last stage reached.
struct DocumentOutcome {
  std::string key;
  OutcomeKind kind = OutcomeKind::Failed;
  std::string message;
  Stage stage = Stage::Loaded;

  static DocumentOutcome failed(std::string key, Stage stage,
                                std::string message) {
    return DocumentOutcome{std::move(key), OutcomeKind::Failed,
                           std::move(message), stage};
  }
};

std::string_view to_string(Stage stage) noexcept;
std::string_view to_string(OutcomeKind kind) noexcept;
std::optional<Stage> parse_stage(std::string_view text);
std::optional<OutcomeKind> parse_outcome_kind(std::string_view text);

// Output file for `source` under the settings' artifact directory.
std::filesystem::path artifact_path_for(ConversionSettings const &settings,
                                        std::filesystem::path const &source);

// Runs one document through every stage on the worker's own collaborators.
// Never throws; every failure becomes a Failed outcome and leaves the
// state store untouched.
class ConversionPipeline {
public:
  explicit ConversionPipeline(WorkerContext &context);

  DocumentOutcome convert(std::filesystem::path const &source);

private:
  struct Document;

  std::string render_diagrams(Document &doc, std::string const &markdown);
  RenderResult render_block(DiagramBlock const &block,
                            std::filesystem::path const &output);
  void produce(Document &doc, std::filesystem::path const &temp_markdown);
  void produce_pdf(Document &doc, std::filesystem::path const &temp_markdown);
  void produce_ebook(Document &doc,
                     std::filesystem::path const &temp_markdown);
  void save_state(Document &doc);

  WorkerContext &context_;
};

} // namespace folio::engine
