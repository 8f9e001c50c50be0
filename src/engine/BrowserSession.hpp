#pragma once

#include "engine/Browser.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace folio::engine {

enum class SessionState { Unstarted, Ready, Stale, Closed };

std::string_view to_string(SessionState state) noexcept;

// True when an automation failure message indicates the browser or its
// session died rather than the page misbehaving.
bool is_crash_indicator(std::string_view message);

// Per-worker owner of one browser engine. Never shared between workers.
class BrowserSession {
public:
  using EngineFactory = std::function<std::unique_ptr<BrowserEngine>()>;

  explicit BrowserSession(EngineFactory factory);
  ~BrowserSession();

  BrowserSession(BrowserSession const &) = delete;
  BrowserSession &operator=(BrowserSession const &) = delete;

  // Returns a fresh page; launches or relaunches the engine as needed.
  // Throws BrowserError when no page can be produced.
  BrowserPage &ensure_ready();

  // Idempotent teardown; failures are logged, never raised.
  void close() noexcept;

  // Runs the final production step with one crash recovery.
  template <typename Action> auto produce(Action &&action) {
    for (int attempt = 1;; ++attempt) {
      try {
        return action(ensure_ready());
      } catch (BrowserError const &ex) {
        if (!should_retry_production(ex, attempt)) {
          throw;
        }
      }
    }
  }

  SessionState state() const noexcept { return state_; }
  int launch_count() const noexcept { return launches_; }

  static constexpr int kProductionAttempts = 2;

private:
  void launch();
  void set_state(SessionState next) noexcept;
  std::unique_ptr<BrowserPage> open_page();
  bool should_retry_production(BrowserError const &error, int attempt);

  EngineFactory factory_;
  std::unique_ptr<BrowserEngine> engine_;
  std::unique_ptr<BrowserPage> page_;
  SessionState state_ = SessionState::Unstarted;
  int launches_ = 0;
};

} // namespace folio::engine
