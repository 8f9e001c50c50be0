#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace folio::engine {

class DiagramServiceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Remote diagram renderer. render_png throws std::runtime_error derivatives
// on transport or service failure.
class DiagramServiceClient {
public:
  virtual ~DiagramServiceClient() = default;
  virtual std::vector<std::uint8_t> render_png(std::string const &source) = 0;
};

using DiagramClientFactory =
    std::function<std::unique_ptr<DiagramServiceClient>()>;

// PlantUML text encoding: raw deflate of the UTF-8 source written in the
// server's 64-character alphabet (0-9 A-Z a-z - _). Throws DiagramServiceError
// when the compressor fails.
std::string plantuml_encode(std::string_view source);

// PlantUML server client: GET <server>/png/<plantuml_encode(source)>.
class PlantUmlClient final : public DiagramServiceClient {
public:
  explicit PlantUmlClient(
      std::string server,
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  std::vector<std::uint8_t> render_png(std::string const &source) override;

  std::string request_url(std::string_view source) const;

private:
  std::string server_;
  std::chrono::milliseconds timeout_;
};

} // namespace folio::engine
