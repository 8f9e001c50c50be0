#pragma once

#include "engine/BrowserSession.hpp"
#include "engine/ConversionSettings.hpp"
#include "engine/DiagramService.hpp"
#include "engine/ExternalTools.hpp"
#include "engine/PollingClock.hpp"
#include "engine/ScriptRenderAdapter.hpp"
#include "engine/ServiceRenderAdapter.hpp"
#include "utils/StateStore.hpp"

#include <functional>
#include <memory>
#include <string>

namespace folio::engine {

// Factories a worker builds its private collaborators from. Tests swap in
// doubles; production uses default_worker_services().
struct WorkerServices {
  BrowserSession::EngineFactory browser;
  DiagramClientFactory diagram_client;
  std::function<std::unique_ptr<Externalizer>()> externalizer;
  std::function<std::unique_ptr<Packager>()> packager;
  std::function<std::unique_ptr<PollingClock>()> clock;
};

WorkerServices default_worker_services(ConversionSettings const &settings);

// Everything one worker owns for one batch run. Constructed on the worker's
// own stack (thread or forked child) and never shared.
class WorkerContext {
public:
  WorkerContext(ConversionSettings settings, WorkerServices const &services);

  WorkerContext(WorkerContext const &) = delete;
  WorkerContext &operator=(WorkerContext const &) = delete;

  ConversionSettings const &settings() const noexcept { return settings_; }
  std::string const &fingerprint() const noexcept { return fingerprint_; }

  PollingClock &clock() noexcept { return *clock_; }
  folio::storage::Database &store() noexcept { return *store_; }
  BrowserSession &browser() noexcept { return *browser_; }
  ScriptRenderAdapter &mermaid() noexcept { return *mermaid_; }
  ServiceRenderAdapter &plantuml() noexcept { return *plantuml_; }
  Externalizer &externalizer() noexcept { return *externalizer_; }
  Packager &packager() noexcept { return *packager_; }

private:
  ConversionSettings settings_;
  std::string fingerprint_;
  std::unique_ptr<PollingClock> clock_;
  std::unique_ptr<folio::storage::Database> store_;
  std::unique_ptr<BrowserSession> browser_;
  std::unique_ptr<ScriptRenderAdapter> mermaid_;
  std::unique_ptr<ServiceRenderAdapter> plantuml_;
  std::unique_ptr<Externalizer> externalizer_;
  std::unique_ptr<Packager> packager_;
};

} // namespace folio::engine
