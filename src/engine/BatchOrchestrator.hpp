#pragma once

#include "engine/ConversionPipeline.hpp"
#include "engine/WorkerContext.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace folio::engine {

struct BatchSummary {
  // One entry per input document, in input order.
  std::vector<DocumentOutcome> outcomes;
  std::size_t converted = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  std::size_t workers = 0;

  std::size_t total() const noexcept { return converted + skipped + failed; }
};

// `*.md` files directly inside `source_dir`, README.md excluded, sorted by
// name.
std::vector<std::filesystem::path>
discover_documents(std::filesystem::path const &source_dir);

// Wire form used by forked workers: one JSON object per line.
std::string encode_outcome(std::size_t index, DocumentOutcome const &outcome);
std::optional<std::pair<std::size_t, DocumentOutcome>>
decode_outcome(std::string_view line);

// Fans a batch out over a bounded pool of workers. Every document yields
// exactly one outcome, whatever happens to the worker that took it.
class BatchOrchestrator {
public:
  BatchOrchestrator(ConversionSettings settings, WorkerServices services);

  BatchSummary run(std::vector<std::filesystem::path> const &documents);

  // Number of workers a batch of `documents` runs on; 1 means inline.
  std::size_t worker_count(std::size_t documents) const noexcept;

private:
  void run_inline(std::vector<std::filesystem::path> const &documents,
                  std::vector<std::optional<DocumentOutcome>> &outcomes);
  void run_threads(std::vector<std::filesystem::path> const &documents,
                   std::size_t workers,
                   std::vector<std::optional<DocumentOutcome>> &outcomes);
  void run_processes(std::vector<std::filesystem::path> const &documents,
                     std::size_t workers,
                     std::vector<std::optional<DocumentOutcome>> &outcomes);

  ConversionSettings settings_;
  WorkerServices services_;
};

} // namespace folio::engine
