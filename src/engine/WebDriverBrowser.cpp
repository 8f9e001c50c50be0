#include "engine/WebDriverBrowser.hpp"

#include "utils/Base64.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <cstdlib>
#include <format>
#include <optional>
#include <thread>
#include <utility>

#include <yyjson.h>

namespace folio::engine
{

namespace
{

// W3C element reference key.
constexpr char const kElementKey[] = "element-6066-11e4-a52e-4f735466cecf";
constexpr double kCmPerInch = 2.54;
constexpr double kA4WidthInches = 8.27;
constexpr double kA4HeightInches = 11.69;

struct WireReply
{
    int status = 0;
    folio::json::Document doc;

    yyjson_val *value() const
    {
        auto *root = doc.root();
        return root != nullptr && yyjson_is_obj(root)
                   ? yyjson_obj_get(root, "value")
                   : nullptr;
    }
};

std::string reply_error(WireReply const &reply)
{
    auto *value = reply.value();
    auto error = folio::json::string_member(value, "error")
                     .value_or(std::format("http status {}", reply.status));
    auto message = folio::json::string_member(value, "message");
    if (message)
    {
        // chromedriver appends multi-line diagnostics; keep the first line.
        if (auto newline = message->find('\n'); newline != std::string::npos)
        {
            message->resize(newline);
        }
        return std::format("{}: {}", error, *message);
    }
    return error;
}

std::string value_as_string(WireReply const &reply)
{
    auto *value = reply.value();
    if (value == nullptr || !yyjson_is_str(value))
    {
        throw BrowserError("protocol error: expected a string value");
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

std::vector<std::uint8_t> decode_image(std::string const &payload,
                                       char const *what)
{
    auto bytes = folio::utils::decode_base64(payload);
    if (!bytes || bytes->empty())
    {
        throw BrowserError(
            std::format("protocol error: undecodable {} payload", what));
    }
    return std::move(*bytes);
}

std::string file_url(std::filesystem::path const &file)
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(file, ec);
    std::string out = "file://";
    for (unsigned char ch : (ec ? file : absolute).generic_string())
    {
        if (std::isalnum(ch) || ch == '/' || ch == '-' || ch == '_' ||
            ch == '.' || ch == '~')
        {
            out.push_back(static_cast<char>(ch));
        }
        else
        {
            out += std::format("%{:02X}", static_cast<unsigned>(ch));
        }
    }
    return out;
}

} // namespace

struct WebDriverConnection
{
    std::string base_url;
    std::string session_id;
    std::string current_window;
    std::chrono::milliseconds timeout{std::chrono::seconds(90)};

    WireReply send(std::string const &method, std::string const &path,
                   std::string body = {}) const
    {
        folio::utils::HttpRequest request;
        request.method = method;
        request.url = base_url + path;
        request.timeout = timeout;
        if (method == "POST")
        {
            request.body = body.empty() ? std::string("{}") : std::move(body);
            request.content_type = "application/json; charset=utf-8";
        }
        folio::utils::HttpResponse response;
        try
        {
            response = folio::utils::http_request(request);
        }
        catch (folio::utils::HttpError const &ex)
        {
            throw BrowserError(std::format("connection closed: {}", ex.what()));
        }
        WireReply reply;
        reply.status = response.status;
        reply.doc = folio::json::Document::parse(response.body);
        return reply;
    }

    WireReply command(std::string const &method, std::string const &path,
                      std::string body = {}) const
    {
        if (session_id.empty())
        {
            throw BrowserError("invalid session id: no active session");
        }
        auto reply = send(method, std::format("/session/{}{}", session_id, path),
                          std::move(body));
        if (reply.status != 200)
        {
            throw BrowserError(reply_error(reply));
        }
        return reply;
    }

    WireReply cdp(std::string const &cmd, folio::json::MutableDocument &params)
    {
        folio::json::MutableDocument body;
        auto *native = body.doc();
        auto *root = body.object_root();
        yyjson_mut_obj_add_strcpy(native, root, "cmd", cmd.c_str());
        auto *copied = yyjson_mut_val_mut_copy(native, params.root());
        yyjson_mut_obj_add_val(native, root, "params",
                               copied != nullptr ? copied
                                                 : yyjson_mut_obj(native));
        return command("POST", "/goog/cdp/execute", body.write());
    }

    void switch_to(std::string const &handle)
    {
        if (current_window == handle)
        {
            return;
        }
        folio::json::MutableDocument body;
        yyjson_mut_obj_add_strcpy(body.doc(), body.object_root(), "handle",
                                  handle.c_str());
        command("POST", "/window", body.write());
        current_window = handle;
    }
};

namespace
{

class WebDriverPage final : public BrowserPage
{
  public:
    WebDriverPage(std::shared_ptr<WebDriverConnection> connection,
                  std::string handle)
        : connection_(std::move(connection)), handle_(std::move(handle))
    {
    }

    ~WebDriverPage() override = default;

    void set_viewport(std::uint32_t width, std::uint32_t height) override
    {
        focus();
        folio::json::MutableDocument params;
        auto *root = params.object_root();
        yyjson_mut_obj_add_uint(params.doc(), root, "width", width);
        yyjson_mut_obj_add_uint(params.doc(), root, "height", height);
        yyjson_mut_obj_add_real(params.doc(), root, "deviceScaleFactor", 1.0);
        yyjson_mut_obj_add_bool(params.doc(), root, "mobile", false);
        connection_->cdp("Emulation.setDeviceMetricsOverride", params);
        folio::json::MutableDocument media;
        yyjson_mut_obj_add_str(media.doc(), media.object_root(), "media",
                               "screen");
        connection_->cdp("Emulation.setEmulatedMedia", media);
    }

    void set_content(std::string const &html) override
    {
        focus();
        folio::json::MutableDocument navigate;
        yyjson_mut_obj_add_str(navigate.doc(), navigate.object_root(), "url",
                               "about:blank");
        connection_->command("POST", "/url", navigate.write());
        folio::json::MutableDocument body;
        auto *native = body.doc();
        auto *root = body.object_root();
        yyjson_mut_obj_add_str(
            native, root, "script",
            "document.open(); document.write(arguments[0]); document.close();");
        auto *args = yyjson_mut_arr(native);
        yyjson_mut_arr_add_strncpy(native, args, html.data(), html.size());
        yyjson_mut_obj_add_val(native, root, "args", args);
        connection_->command("POST", "/execute/sync", body.write());
    }

    void load_file(std::filesystem::path const &file) override
    {
        focus();
        folio::json::MutableDocument body;
        auto url = file_url(file);
        yyjson_mut_obj_add_strcpy(body.doc(), body.object_root(), "url",
                                  url.c_str());
        connection_->command("POST", "/url", body.write());
    }

    std::optional<std::string> query_selector(std::string const &css) override
    {
        focus();
        folio::json::MutableDocument body;
        auto *root = body.object_root();
        yyjson_mut_obj_add_str(body.doc(), root, "using", "css selector");
        yyjson_mut_obj_add_strcpy(body.doc(), root, "value", css.c_str());
        auto reply = connection_->send(
            "POST", std::format("/session/{}/element", connection_->session_id),
            body.write());
        if (reply.status == 404)
        {
            auto error = folio::json::string_member(reply.value(), "error");
            if (error && *error == "no such element")
            {
                return std::nullopt;
            }
        }
        if (reply.status != 200)
        {
            throw BrowserError(reply_error(reply));
        }
        auto id = folio::json::string_member(reply.value(), kElementKey);
        if (!id)
        {
            throw BrowserError("protocol error: element reference missing");
        }
        return id;
    }

    std::optional<ElementBox> bounding_box(std::string const &element) override
    {
        focus();
        auto reply = connection_->send(
            "GET", std::format("/session/{}/element/{}/rect",
                               connection_->session_id, element));
        if (reply.status != 200)
        {
            FOLIO_LOG_DEBUG("element rect unavailable: {}", reply_error(reply));
            return std::nullopt;
        }
        auto *value = reply.value();
        auto width = folio::json::number_member(value, "width");
        auto height = folio::json::number_member(value, "height");
        if (!width || !height)
        {
            return std::nullopt;
        }
        ElementBox box;
        box.x = folio::json::number_member(value, "x").value_or(0.0);
        box.y = folio::json::number_member(value, "y").value_or(0.0);
        box.width = *width;
        box.height = *height;
        return box;
    }

    std::string inner_html(std::string const &element) override
    {
        focus();
        auto reply = connection_->command(
            "GET", std::format("/element/{}/property/innerHTML", element));
        auto *value = reply.value();
        if (value == nullptr || yyjson_is_null(value))
        {
            return {};
        }
        return value_as_string(reply);
    }

    std::string evaluate(std::string const &script) override
    {
        focus();
        folio::json::MutableDocument body;
        auto *native = body.doc();
        auto *root = body.object_root();
        yyjson_mut_obj_add_strcpy(native, root, "script", script.c_str());
        yyjson_mut_obj_add_val(native, root, "args", yyjson_mut_arr(native));
        auto reply = connection_->command("POST", "/execute/sync", body.write());
        auto *value = reply.value();
        if (value == nullptr)
        {
            return "null";
        }
        std::size_t length = 0;
        char *text = yyjson_val_write(value, 0, &length);
        if (text == nullptr)
        {
            return "null";
        }
        std::string result(text, length);
        std::free(text);
        return result;
    }

    std::vector<std::uint8_t>
    screenshot_element(std::string const &element) override
    {
        focus();
        auto reply = connection_->command(
            "GET", std::format("/element/{}/screenshot", element));
        return decode_image(value_as_string(reply), "element screenshot");
    }

    std::vector<std::uint8_t> screenshot_page() override
    {
        focus();
        folio::json::MutableDocument metrics_params;
        metrics_params.object_root();
        auto metrics =
            connection_->cdp("Page.getLayoutMetrics", metrics_params);
        auto *content = yyjson_obj_get(metrics.value(), "cssContentSize");
        if (content == nullptr)
        {
            content = yyjson_obj_get(metrics.value(), "contentSize");
        }
        folio::json::MutableDocument params;
        auto *native = params.doc();
        auto *root = params.object_root();
        yyjson_mut_obj_add_str(native, root, "format", "png");
        yyjson_mut_obj_add_bool(native, root, "captureBeyondViewport", true);
        auto width = folio::json::number_member(content, "width");
        auto height = folio::json::number_member(content, "height");
        if (width && height && *width > 0 && *height > 0)
        {
            auto *clip = yyjson_mut_obj(native);
            yyjson_mut_obj_add_real(native, clip, "x", 0.0);
            yyjson_mut_obj_add_real(native, clip, "y", 0.0);
            yyjson_mut_obj_add_real(native, clip, "width", *width);
            yyjson_mut_obj_add_real(native, clip, "height", *height);
            yyjson_mut_obj_add_real(native, clip, "scale", 1.0);
            yyjson_mut_obj_add_val(native, root, "clip", clip);
        }
        auto reply = connection_->cdp("Page.captureScreenshot", params);
        auto data = folio::json::string_member(reply.value(), "data");
        if (!data)
        {
            throw BrowserError("protocol error: screenshot data missing");
        }
        return decode_image(*data, "page screenshot");
    }

    std::vector<std::uint8_t> print_pdf(PdfOptions const &options) override
    {
        focus();
        folio::json::MutableDocument params;
        auto *native = params.doc();
        auto *root = params.object_root();
        yyjson_mut_obj_add_real(native, root, "paperWidth", kA4WidthInches);
        yyjson_mut_obj_add_real(native, root, "paperHeight", kA4HeightInches);
        yyjson_mut_obj_add_real(native, root, "marginTop",
                                options.margin_top_cm / kCmPerInch);
        yyjson_mut_obj_add_real(native, root, "marginRight",
                                options.margin_right_cm / kCmPerInch);
        yyjson_mut_obj_add_real(native, root, "marginBottom",
                                options.margin_bottom_cm / kCmPerInch);
        yyjson_mut_obj_add_real(native, root, "marginLeft",
                                options.margin_left_cm / kCmPerInch);
        yyjson_mut_obj_add_bool(native, root, "printBackground", true);
        yyjson_mut_obj_add_bool(native, root, "preferCSSPageSize", true);
        yyjson_mut_obj_add_real(native, root, "scale", 1.0);
        yyjson_mut_obj_add_bool(native, root, "displayHeaderFooter",
                                options.page_number_footer);
        if (options.page_number_footer)
        {
            yyjson_mut_obj_add_str(native, root, "headerTemplate",
                                   "<div></div>");
            yyjson_mut_obj_add_str(
                native, root, "footerTemplate",
                "<div style=\"font-size: 10px; text-align: center; width: "
                "100%; margin: 0 auto;\"><span class=\"pageNumber\"></span>"
                "</div>");
        }
        auto reply = connection_->cdp("Page.printToPDF", params);
        auto data = folio::json::string_member(reply.value(), "data");
        if (!data)
        {
            throw BrowserError("protocol error: pdf data missing");
        }
        return decode_image(*data, "pdf");
    }

    void activate() override
    {
        if (closed_)
        {
            throw BrowserError("target closed: page already closed");
        }
        connection_->current_window.clear();
        connection_->switch_to(handle_);
    }

    void close() override
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        connection_->switch_to(handle_);
        connection_->current_window.clear();
        connection_->command("DELETE", "/window");
    }

    bool is_closed() const noexcept override
    {
        return closed_;
    }

  private:
    void focus()
    {
        if (closed_)
        {
            throw BrowserError("target closed: page already closed");
        }
        connection_->switch_to(handle_);
    }

    std::shared_ptr<WebDriverConnection> connection_;
    std::string handle_;
    bool closed_ = false;
};

} // namespace

WebDriverBrowser::WebDriverBrowser(WebDriverOptions options)
    : options_(std::move(options))
{
}

WebDriverBrowser::~WebDriverBrowser()
{
    try
    {
        close_session();
    }
    catch (std::exception const &ex)
    {
        FOLIO_LOG_DEBUG("session teardown in destructor failed: {}",
                        ex.what());
    }
    stop_host();
}

void WebDriverBrowser::start()
{
    if (!host_.running())
    {
        connection_.reset();
        launch_host();
        wait_until_ready();
    }
    if (!connection_ || connection_->session_id.empty())
    {
        create_session();
    }
}

void WebDriverBrowser::launch_host()
{
    auto port = folio::utils::reserve_loopback_port();
    if (!port)
    {
        throw BrowserError("cannot reserve a loopback port for chromedriver");
    }
    std::vector<std::string> argv = {options_.chromedriver,
                                     std::format("--port={}", *port),
                                     "--allowed-ips=127.0.0.1"};
    if (!host_.spawn(argv, options_.log_path))
    {
        throw BrowserError(
            std::format("failed to launch {}", options_.chromedriver));
    }
    connection_ = std::make_shared<WebDriverConnection>();
    connection_->base_url = std::format("http://127.0.0.1:{}", *port);
    connection_->timeout = options_.command_timeout;
    initial_window_adopted_ = false;
}

void WebDriverBrowser::wait_until_ready()
{
    auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
    std::string last_error = "no response";
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (!host_.running())
        {
            throw BrowserError(std::format("{} exited during startup",
                                           options_.chromedriver));
        }
        try
        {
            auto saved = connection_->timeout;
            connection_->timeout = std::chrono::milliseconds(1000);
            auto reply = connection_->send("GET", "/status");
            connection_->timeout = saved;
            if (reply.status == 200 && yyjson_is_true(yyjson_obj_get(
                                           reply.value(), "ready")))
            {
                return;
            }
            last_error = std::format("status {}", reply.status);
        }
        catch (BrowserError const &ex)
        {
            connection_->timeout = options_.command_timeout;
            last_error = ex.what();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    throw BrowserError(std::format("{} not ready after {} ms: {}",
                                   options_.chromedriver,
                                   options_.startup_timeout.count(),
                                   last_error));
}

void WebDriverBrowser::create_session()
{
    folio::json::MutableDocument body;
    auto *native = body.doc();
    auto *root = body.object_root();
    auto *capabilities = yyjson_mut_obj(native);
    auto *always = yyjson_mut_obj(native);
    auto *chrome = yyjson_mut_obj(native);
    auto *args = yyjson_mut_arr(native);
    for (auto const *arg : {"--headless=new", "--disable-gpu",
                            "--disable-dev-shm-usage", "--no-sandbox",
                            "--hide-scrollbars", "--force-color-profile=srgb"})
    {
        yyjson_mut_arr_add_str(native, args, arg);
    }
    yyjson_mut_obj_add_val(native, chrome, "args", args);
    if (!options_.browser_binary.empty())
    {
        yyjson_mut_obj_add_strcpy(native, chrome, "binary",
                                  options_.browser_binary.c_str());
    }
    yyjson_mut_obj_add_str(native, always, "browserName", "chrome");
    yyjson_mut_obj_add_val(native, always, "goog:chromeOptions", chrome);
    yyjson_mut_obj_add_val(native, capabilities, "alwaysMatch", always);
    yyjson_mut_obj_add_val(native, root, "capabilities", capabilities);

    auto reply = connection_->send("POST", "/session", body.write());
    if (reply.status != 200)
    {
        throw BrowserError(
            std::format("session not created: {}", reply_error(reply)));
    }
    auto session = folio::json::string_member(reply.value(), "sessionId");
    if (!session)
    {
        throw BrowserError("protocol error: sessionId missing");
    }
    connection_->session_id = *session;
    connection_->current_window.clear();
    initial_window_adopted_ = false;
    FOLIO_LOG_DEBUG("webdriver session {} ready on {}", *session,
                    connection_->base_url);
}

bool WebDriverBrowser::is_connected()
{
    if (!connection_ || connection_->session_id.empty() || !host_.running())
    {
        return false;
    }
    try
    {
        connection_->command("GET", "/window/handles");
        return true;
    }
    catch (BrowserError const &ex)
    {
        FOLIO_LOG_DEBUG("liveness probe failed: {}", ex.what());
        return false;
    }
}

std::unique_ptr<BrowserPage> WebDriverBrowser::new_page()
{
    if (!connection_ || connection_->session_id.empty())
    {
        throw BrowserError("invalid session id: browser not started");
    }
    std::string handle;
    if (!initial_window_adopted_)
    {
        auto reply = connection_->command("GET", "/window");
        handle = value_as_string(reply);
        initial_window_adopted_ = true;
    }
    else
    {
        folio::json::MutableDocument body;
        yyjson_mut_obj_add_str(body.doc(), body.object_root(), "type", "tab");
        auto reply = connection_->command("POST", "/window/new", body.write());
        auto created = folio::json::string_member(reply.value(), "handle");
        if (!created)
        {
            throw BrowserError("protocol error: new window handle missing");
        }
        handle = *created;
    }
    connection_->current_window.clear();
    connection_->switch_to(handle);
    return std::make_unique<WebDriverPage>(connection_, handle);
}

void WebDriverBrowser::close_session()
{
    if (!connection_ || connection_->session_id.empty())
    {
        return;
    }
    auto session = std::exchange(connection_->session_id, std::string{});
    connection_->current_window.clear();
    initial_window_adopted_ = false;
    auto reply = connection_->send("DELETE", std::format("/session/{}", session));
    if (reply.status != 200)
    {
        throw BrowserError(reply_error(reply));
    }
}

void WebDriverBrowser::stop_host()
{
    host_.terminate();
    connection_.reset();
}

} // namespace folio::engine
