#include "TestDoubles.hpp"
#include "engine/ServiceRenderAdapter.hpp"

#include <doctest/doctest.h>

using namespace folio::engine;
using namespace std::chrono_literals;

TEST_CASE("transient service errors are recognised")
{
    CHECK(is_transient_service_error("SSL: UNEXPECTED_EOF_WHILE_READING"));
    CHECK(is_transient_service_error("timeout after 30000 ms"));
    CHECK(is_transient_service_error("connection error: connection refused"));
    CHECK(is_transient_service_error("Remote disconnected inside a chunked body"));
    CHECK_FALSE(is_transient_service_error("PlantUML server returned HTTP 400"));
}

TEST_CASE("transient failures back off and retry with a fresh client")
{
    folio::test::ScratchDir scratch("plantuml");
    auto service = std::make_shared<folio::test::FakeServiceState>();
    service->errors = {"remote disconnected before response",
                       "timeout after 30000 ms waiting for server"};
    folio::test::FakeClock clock;
    ServiceRenderAdapter adapter(folio::test::fake_client_factory(service),
                                 clock);

    auto result = adapter.render("@startuml\nA -> B\n@enduml",
                                 scratch / "p.png", {});
    REQUIRE(result.ok());
    CHECK(adapter.last_attempts() == 3);
    CHECK(service->calls == 3);
    CHECK(service->clients_built == 3);
    REQUIRE(clock.sleeps.size() == 2);
    CHECK(clock.sleeps[0] == 2000ms);
    CHECK(clock.sleeps[1] == 4000ms);
    CHECK(result.display.width == 1680u);
    CHECK(folio::utils::is_nonempty_file(scratch / "p.png"));
}

TEST_CASE("a non-transient failure is fatal after one attempt")
{
    folio::test::ScratchDir scratch("plantuml-fatal");
    auto service = std::make_shared<folio::test::FakeServiceState>();
    service->errors = {"PlantUML server returned HTTP 400"};
    folio::test::FakeClock clock;
    ServiceRenderAdapter adapter(folio::test::fake_client_factory(service),
                                 clock);

    auto result = adapter.render("@startuml\n@enduml", scratch / "p.png", {});
    CHECK(result.status == RenderStatus::FatalError);
    CHECK(result.message ==
          "Failed to render PlantUML diagram: PlantUML server returned HTTP 400");
    CHECK(adapter.last_attempts() == 1);
    CHECK(clock.sleeps.empty());
}

TEST_CASE("retries stop after the attempt budget")
{
    folio::test::ScratchDir scratch("plantuml-budget");
    auto service = std::make_shared<folio::test::FakeServiceState>();
    service->errors = {"timeout", "timeout", "timeout", "timeout"};
    folio::test::FakeClock clock;
    ServiceRenderAdapter adapter(folio::test::fake_client_factory(service),
                                 clock);

    auto result = adapter.render("@startuml\n@enduml", scratch / "p.png", {});
    CHECK(result.status == RenderStatus::FatalError);
    CHECK(adapter.last_attempts() == 3);
    CHECK(service->calls == 3);
    CHECK(clock.sleeps.size() == 2);
    CHECK_FALSE(std::filesystem::exists(scratch / "p.png"));
}
