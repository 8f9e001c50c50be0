#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace folio::engine {

struct ToolResult {
  bool ok = false;
  std::string message;

  static ToolResult success() { return ToolResult{true, {}}; }
  static ToolResult failure(std::string message) {
    return ToolResult{false, std::move(message)};
  }
};

struct EpubMetadata {
  std::string title;
  std::string author;
  std::string language;
  std::optional<std::filesystem::path> stylesheet;
};

// Turns processed Markdown into the intermediate HTML or an EPUB container.
class Externalizer {
public:
  virtual ~Externalizer() = default;
  virtual ToolResult to_html(std::filesystem::path const &markdown,
                             std::filesystem::path const &html) = 0;
  virtual ToolResult to_epub(std::filesystem::path const &markdown,
                             std::filesystem::path const &epub,
                             EpubMetadata const &metadata) = 0;
};

// Repackages an EPUB for older e-readers.
class Packager {
public:
  virtual ~Packager() = default;
  virtual ToolResult epub_to_mobi(std::filesystem::path const &epub,
                                  std::filesystem::path const &mobi) = 0;
};

// Wall-clock limit for one pandoc or ebook-convert run.
inline constexpr std::chrono::milliseconds kDefaultToolTimeout =
    std::chrono::minutes(10);

class PandocExternalizer final : public Externalizer {
public:
  explicit PandocExternalizer(
      std::string program = "pandoc",
      std::chrono::milliseconds timeout = kDefaultToolTimeout);

  ToolResult to_html(std::filesystem::path const &markdown,
                     std::filesystem::path const &html) override;
  ToolResult to_epub(std::filesystem::path const &markdown,
                     std::filesystem::path const &epub,
                     EpubMetadata const &metadata) override;

private:
  std::string program_;
  std::chrono::milliseconds timeout_;
};

class EbookConvertPackager final : public Packager {
public:
  explicit EbookConvertPackager(
      std::string program = "ebook-convert",
      std::chrono::milliseconds timeout = kDefaultToolTimeout);

  ToolResult epub_to_mobi(std::filesystem::path const &epub,
                          std::filesystem::path const &mobi) override;

private:
  std::string program_;
  std::chrono::milliseconds timeout_;
};

} // namespace folio::engine
