#pragma once

#include "engine/BrowserSession.hpp"
#include "engine/Dimension.hpp"
#include "engine/PollingClock.hpp"
#include "engine/RenderAdapter.hpp"

#include <chrono>
#include <string>

namespace folio::engine {

struct ScriptRenderOptions {
  Dimension max_width = Pixels{kDefaultPageWidthPx};
  Dimension max_height = Pixels{kDefaultPageHeightPx};
  std::string runtime_url =
      "https://unpkg.com/mermaid@10.6.1/dist/mermaid.min.js";
  std::chrono::milliseconds max_wait{5000};
  std::chrono::milliseconds svg_poll_interval{100};
  std::chrono::milliseconds stability_poll_interval{50};
  int stability_checks = 3;
  double stability_tolerance_px = 1.0;
  std::chrono::milliseconds relayout_wait{100};
};

// Mermaid rendered inside a page of the worker's browser session.
class ScriptRenderAdapter final : public RenderAdapter {
public:
  ScriptRenderAdapter(BrowserSession &session, PollingClock &clock,
                      ScriptRenderOptions options = {});

  RenderResult render(std::string const &source,
                      std::filesystem::path const &output_path,
                      RenderDirective const &directive) override;

  // Whether the last render saw the layout settle before the budget ran out.
  bool last_render_stabilized() const noexcept { return last_stabilized_; }

  std::string build_document(std::string const &source) const;

private:
  RenderResult render_on(BrowserPage &page, std::string const &source,
                         std::filesystem::path const &output_path,
                         RenderDirective const &directive);
  bool wait_for_svg(BrowserPage &page, std::chrono::milliseconds start);
  bool wait_for_stable_layout(BrowserPage &page,
                              std::chrono::milliseconds start);

  BrowserSession &session_;
  PollingClock &clock_;
  ScriptRenderOptions options_;
  bool last_stabilized_ = false;
};

} // namespace folio::engine
