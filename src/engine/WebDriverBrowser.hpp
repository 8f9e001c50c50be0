#pragma once

#include "engine/Browser.hpp"
#include "utils/Process.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace folio::engine {

struct WebDriverOptions {
  std::string chromedriver = "chromedriver";
  // Chrome binary; empty lets chromedriver pick its default.
  std::string browser_binary;
  std::chrono::milliseconds startup_timeout{std::chrono::seconds(15)};
  std::chrono::milliseconds command_timeout{std::chrono::seconds(90)};
  // chromedriver stdout/stderr; empty discards it.
  std::filesystem::path log_path;
};

struct WebDriverConnection;

// Headless Chrome driven over the W3C WebDriver protocol. Viewport
// emulation, full-page capture and PDF printing go through chromedriver's
// DevTools passthrough.
class WebDriverBrowser final : public BrowserEngine {
public:
  explicit WebDriverBrowser(WebDriverOptions options);
  ~WebDriverBrowser() override;

  WebDriverBrowser(WebDriverBrowser const &) = delete;
  WebDriverBrowser &operator=(WebDriverBrowser const &) = delete;

  void start() override;
  bool is_connected() override;
  std::unique_ptr<BrowserPage> new_page() override;
  void close_session() override;
  void stop_host() override;

private:
  void launch_host();
  void wait_until_ready();
  void create_session();

  WebDriverOptions options_;
  folio::utils::ChildProcess host_;
  std::shared_ptr<WebDriverConnection> connection_;
  bool initial_window_adopted_ = false;
};

} // namespace folio::engine
