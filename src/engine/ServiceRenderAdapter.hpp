#pragma once

#include "engine/DiagramService.hpp"
#include "engine/Dimension.hpp"
#include "engine/PollingClock.hpp"
#include "engine/RenderAdapter.hpp"

#include <memory>
#include <string_view>

namespace folio::engine {

struct ServiceRenderOptions {
  Dimension max_width = Pixels{kDefaultPageWidthPx};
  Dimension max_height = Pixels{kDefaultPageHeightPx};
  int max_attempts = 3;
};

// True for network-level failures worth another attempt.
bool is_transient_service_error(std::string_view message);

// PlantUML through a render service. Transient failures back off 2^attempt
// seconds and retry with a freshly built client.
class ServiceRenderAdapter final : public RenderAdapter {
public:
  ServiceRenderAdapter(DiagramClientFactory factory, PollingClock &clock,
                       ServiceRenderOptions options = {});

  RenderResult render(std::string const &source,
                      std::filesystem::path const &output_path,
                      RenderDirective const &directive) override;

  int last_attempts() const noexcept { return last_attempts_; }

private:
  DiagramClientFactory factory_;
  PollingClock &clock_;
  ServiceRenderOptions options_;
  std::unique_ptr<DiagramServiceClient> client_;
  int last_attempts_ = 0;
};

} // namespace folio::engine
