#include "TestDoubles.hpp"
#include "engine/DiagramService.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Process.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <string>
#include <thread>

#include <doctest/doctest.h>
#include <mongoose.h>

namespace
{

// Loopback server answering /echo with the request body and /png/* with a
// small PNG; anything else is 404.
class LoopbackServer
{
  public:
    LoopbackServer()
    {
        mg_mgr_init(&mgr_);
        if (auto port = folio::utils::reserve_loopback_port())
        {
            url_ = std::format("http://127.0.0.1:{}", *port);
            listener_ = mg_http_listen(&mgr_, url_.c_str(), handle, this);
        }
        if (listener_ != nullptr)
        {
            worker_ = std::thread(
                [this]
                {
                    while (!stop_.load())
                    {
                        mg_mgr_poll(&mgr_, 20);
                    }
                });
        }
    }

    ~LoopbackServer()
    {
        stop_.store(true);
        if (worker_.joinable())
        {
            worker_.join();
        }
        mg_mgr_free(&mgr_);
    }

    bool ready() const noexcept
    {
        return listener_ != nullptr;
    }
    std::string const &url() const noexcept
    {
        return url_;
    }
    std::string last_uri() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_uri_;
    }

  private:
    static void handle(struct mg_connection *conn, int ev, void *ev_data)
    {
        if (ev != MG_EV_HTTP_MSG)
        {
            return;
        }
        auto *self = static_cast<LoopbackServer *>(conn->fn_data);
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        std::string uri(hm->uri.buf, hm->uri.len);
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->last_uri_ = uri;
        }
        if (uri == "/echo")
        {
            mg_http_reply(conn, 200, "Content-Type: text/plain\r\n", "%.*s",
                          static_cast<int>(hm->body.len), hm->body.buf);
        }
        else if (uri.starts_with("/png/"))
        {
            auto png = folio::test::make_png(64, 32);
            mg_printf(conn,
                      "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\n"
                      "Content-Length: %d\r\n\r\n",
                      static_cast<int>(png.size()));
            mg_send(conn, png.data(), png.size());
        }
        else
        {
            mg_http_reply(conn, 404, "", "not found");
        }
    }

    struct mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::string url_;
    mutable std::mutex mutex_;
    std::string last_uri_;
    std::atomic<bool> stop_{false};
    std::thread worker_;
};

} // namespace

TEST_CASE("http_request talks to a live server")
{
    LoopbackServer server;
    REQUIRE(server.ready());

    folio::utils::HttpRequest request;
    request.method = "POST";
    request.url = server.url() + "/echo";
    request.body = "hello folio";
    request.content_type = "text/plain";
    request.timeout = std::chrono::seconds(5);
    auto response = folio::utils::http_request(request);
    CHECK(response.status == 200);
    CHECK(response.body == "hello folio");
    CHECK(response.content_type == "text/plain");

    folio::utils::HttpRequest missing;
    missing.url = server.url() + "/nope";
    missing.timeout = std::chrono::seconds(5);
    CHECK(folio::utils::http_request(missing).status == 404);
}

TEST_CASE("connection failures raise HttpError")
{
    auto port = folio::utils::reserve_loopback_port();
    REQUIRE(port);
    folio::utils::HttpRequest request;
    request.url = std::format("http://127.0.0.1:{}/", *port);
    request.timeout = std::chrono::seconds(5);
    CHECK_THROWS_AS(folio::utils::http_request(request),
                    folio::utils::HttpError);

    folio::utils::HttpRequest invalid;
    invalid.url = "";
    CHECK_THROWS_AS(folio::utils::http_request(invalid),
                    folio::utils::HttpError);
}

TEST_CASE("PlantUML client requests the deflate-encoded source")
{
    folio::engine::PlantUmlClient client("http://render.example/plantuml/");
    CHECK(client.request_url("A -> B") ==
          "http://render.example/plantuml/png/SrJGjLDm0W00");

    LoopbackServer server;
    REQUIRE(server.ready());
    folio::engine::PlantUmlClient live(server.url(), std::chrono::seconds(5));
    auto png = live.render_png("A -> B");
    REQUIRE(png.size() > 24);
    CHECK(png[1] == 'P');
    CHECK(server.last_uri() == "/png/SrJGjLDm0W00");

    folio::engine::PlantUmlClient wrong(server.url() + "/other",
                                        std::chrono::seconds(5));
    CHECK_THROWS_AS(wrong.render_png("A -> B"),
                    folio::engine::DiagramServiceError);
}
