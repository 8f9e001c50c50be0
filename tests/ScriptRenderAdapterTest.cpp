#include "TestDoubles.hpp"
#include "engine/ScriptRenderAdapter.hpp"

#include <doctest/doctest.h>

using namespace folio::engine;

namespace
{

struct MermaidFixture
{
    folio::test::ScratchDir scratch{"mermaid"};
    std::shared_ptr<folio::test::FakeBrowserState> state =
        std::make_shared<folio::test::FakeBrowserState>();
    folio::test::FakeClock clock;
    BrowserSession session{folio::test::fake_engine_factory(state)};

    RenderResult render(RenderDirective directive = {},
                        ScriptRenderOptions options = {})
    {
        ScriptRenderAdapter adapter(session, clock, options);
        auto result =
            adapter.render("graph TD\n  A-->B", scratch / "d.png", directive);
        stabilized = adapter.last_render_stabilized();
        return result;
    }

    bool stabilized = false;
};

} // namespace

TEST_CASE("a Mermaid render writes the capture and fits it to the page")
{
    MermaidFixture fx;
    auto result = fx.render();
    REQUIRE(result.ok());
    CHECK(fx.stabilized);
    CHECK(folio::utils::is_nonempty_file(fx.scratch / "d.png"));
    CHECK(result.raster.width == 840u);
    CHECK(result.raster.height == 600u);
    CHECK(result.display.width == 1680u);
    CHECK(result.display.height == 1200u);
}

TEST_CASE("sizing directives and bounds shape the display size")
{
    MermaidFixture fx;
    RenderDirective keep;
    keep.no_resize = true;
    auto untouched = fx.render(keep);
    REQUIRE(untouched.ok());
    CHECK(untouched.display.width == 840u);
    CHECK(untouched.display.height == 600u);

    ScriptRenderOptions narrow;
    narrow.max_width = Pixels{1000};
    auto bounded = fx.render({}, narrow);
    REQUIRE(bounded.ok());
    CHECK(bounded.display.width == 1000u);
    CHECK(bounded.display.height == 714u);
}

TEST_CASE("a diagram syntax error is fatal and carries the message")
{
    MermaidFixture fx;
    fx.state->syntax_error = true;
    auto result = fx.render();
    CHECK(result.status == RenderStatus::FatalError);
    CHECK(result.message.find("Parse error on line 2") != std::string::npos);
}

TEST_CASE("an SVG that never appears still yields a capture")
{
    MermaidFixture fx;
    fx.state->svg_after_polls = 1000;
    auto result = fx.render();
    REQUIRE(result.ok());
    CHECK_FALSE(fx.stabilized);
    CHECK(fx.clock.now() >= std::chrono::milliseconds(5000));
    CHECK(folio::utils::is_nonempty_file(fx.scratch / "d.png"));
    CHECK(result.raster.width == 840u);
}

TEST_CASE("a layout that keeps moving is captured anyway")
{
    MermaidFixture fx;
    for (int i = 0; i < 300; ++i)
    {
        fx.state->boxes.push_back(ElementBox{0, 0, 100.0 + i * 5, 80.0});
    }
    auto result = fx.render();
    REQUIRE(result.ok());
    CHECK_FALSE(fx.stabilized);
}

TEST_CASE("a browser crash is reported as retryable")
{
    MermaidFixture fx;
    fx.state->crash_renders = 1;
    auto crashed = fx.render();
    CHECK(crashed.status == RenderStatus::RetryableError);

    auto retried = fx.render();
    CHECK(retried.ok());
    CHECK(fx.session.launch_count() == 2);
}

TEST_CASE("the diagram source is escaped into the host page")
{
    MermaidFixture fx;
    ScriptRenderAdapter adapter(fx.session, fx.clock);
    auto html = adapter.build_document("A --> B & C <br>");
    CHECK(html.find("A --&gt; B &amp; C &lt;br&gt;") != std::string::npos);
    CHECK(html.find("mermaid.min.js") != std::string::npos);
}
