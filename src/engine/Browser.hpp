#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio::engine {

// Raised by the automation boundary; adapters turn it into explicit results.
class BrowserError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ElementBox {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

struct PdfOptions {
  // Page margins in centimetres.
  double margin_top_cm = 2.54;
  double margin_right_cm = 1.905;
  double margin_bottom_cm = 2.54;
  double margin_left_cm = 1.905;
  bool page_number_footer = true;
};

// One tab of the automated browser. Element handles are opaque strings owned
// by the page and invalid once it closes.
class BrowserPage {
public:
  virtual ~BrowserPage() = default;

  virtual void set_viewport(std::uint32_t width, std::uint32_t height) = 0;
  virtual void set_content(std::string const &html) = 0;
  virtual void load_file(std::filesystem::path const &file) = 0;
  virtual std::optional<std::string> query_selector(std::string const &css) = 0;
  virtual std::optional<ElementBox> bounding_box(std::string const &element) = 0;
  virtual std::string inner_html(std::string const &element) = 0;
  // Runs the body of a function and returns its result as JSON text.
  virtual std::string evaluate(std::string const &script) = 0;
  virtual std::vector<std::uint8_t>
  screenshot_element(std::string const &element) = 0;
  virtual std::vector<std::uint8_t> screenshot_page() = 0;
  virtual std::vector<std::uint8_t> print_pdf(PdfOptions const &options) = 0;
  virtual void activate() = 0;
  virtual void close() = 0;
  virtual bool is_closed() const noexcept = 0;
};

// Host process plus automation session. start() launches both; stop_host()
// only ever tears down the host.
class BrowserEngine {
public:
  virtual ~BrowserEngine() = default;

  virtual void start() = 0;
  virtual bool is_connected() = 0;
  virtual std::unique_ptr<BrowserPage> new_page() = 0;
  virtual void close_session() = 0;
  virtual void stop_host() = 0;
};

} // namespace folio::engine
