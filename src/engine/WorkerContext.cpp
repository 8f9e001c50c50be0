#include "engine/WorkerContext.hpp"

#include "engine/Fingerprint.hpp"
#include "engine/WebDriverBrowser.hpp"

#include <stdexcept>
#include <utility>

namespace folio::engine
{

WorkerServices default_worker_services(ConversionSettings const &settings)
{
    WorkerServices services;
    WebDriverOptions driver;
    driver.chromedriver = settings.chromedriver;
    driver.browser_binary = settings.browser_binary;
    driver.log_path = settings.temp_dir / "chromedriver.log";
    services.browser = [driver]() -> std::unique_ptr<BrowserEngine>
    { return std::make_unique<WebDriverBrowser>(driver); };
    services.diagram_client =
        [server = settings.plantuml_server]() -> std::unique_ptr<DiagramServiceClient>
    { return std::make_unique<PlantUmlClient>(server); };
    services.externalizer = []() -> std::unique_ptr<Externalizer>
    { return std::make_unique<PandocExternalizer>(); };
    services.packager = []() -> std::unique_ptr<Packager>
    { return std::make_unique<EbookConvertPackager>(); };
    services.clock = []() -> std::unique_ptr<PollingClock>
    { return std::make_unique<SteadyPollingClock>(); };
    return services;
}

WorkerContext::WorkerContext(ConversionSettings settings,
                             WorkerServices const &services)
    : settings_(std::move(settings)),
      fingerprint_(configuration_fingerprint(fingerprint_inputs(settings_))),
      clock_(services.clock()),
      store_(std::make_unique<folio::storage::Database>(settings_.db_path)),
      browser_(std::make_unique<BrowserSession>(services.browser))
{
    if (!store_->is_valid())
    {
        throw std::runtime_error("cannot open state database " +
                                 settings_.db_path.string());
    }
    ScriptRenderOptions script;
    script.max_width = settings_.max_width;
    script.max_height = settings_.max_height;
    mermaid_ = std::make_unique<ScriptRenderAdapter>(*browser_, *clock_, script);

    ServiceRenderOptions service;
    service.max_width = settings_.max_width;
    service.max_height = settings_.max_height;
    plantuml_ = std::make_unique<ServiceRenderAdapter>(services.diagram_client,
                                                       *clock_, service);
    externalizer_ = services.externalizer();
    packager_ = services.packager();
}

} // namespace folio::engine
