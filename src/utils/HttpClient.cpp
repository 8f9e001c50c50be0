#include "utils/HttpClient.hpp"

#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <mutex>
#include <optional>
#include <string_view>

#include <mongoose.h>

namespace folio::utils
{

namespace
{

struct Exchange
{
    std::string request;
    std::string received;
    std::string error;
    bool use_tls = false;
    std::string tls_host;
    bool request_sent = false;
    bool complete = false;
    bool closed = false;
};

std::string_view to_view(struct mg_str const &value)
{
    return std::string_view(value.buf, value.len);
}

std::optional<std::size_t> parse_size(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
    {
        text.remove_prefix(1);
    }
    std::size_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data())
    {
        return std::nullopt;
    }
    return value;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        auto a = static_cast<unsigned char>(lhs[i]);
        auto b = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(a) != std::tolower(b))
        {
            return false;
        }
    }
    return true;
}

std::optional<std::string> decode_chunked(std::string_view body)
{
    std::string out;
    while (true)
    {
        auto line_end = body.find("\r\n");
        if (line_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto size_text = body.substr(0, line_end);
        if (auto semi = size_text.find(';'); semi != std::string_view::npos)
        {
            size_text = size_text.substr(0, semi);
        }
        std::size_t chunk = 0;
        auto [ptr, ec] = std::from_chars(
            size_text.data(), size_text.data() + size_text.size(), chunk, 16);
        if (ec != std::errc{} || ptr == size_text.data())
        {
            return std::nullopt;
        }
        body.remove_prefix(line_end + 2);
        if (chunk == 0)
        {
            return out;
        }
        if (body.size() < chunk + 2)
        {
            return std::nullopt;
        }
        out.append(body.substr(0, chunk));
        body.remove_prefix(chunk + 2);
    }
}

// Complete once the headers are in and the declared body length arrived.
// Bodies without a length are delimited by the peer closing the socket.
bool response_complete(std::string const &received)
{
    struct mg_http_message hm{};
    int header_len = mg_http_parse(received.data(), received.size(), &hm);
    if (header_len <= 0)
    {
        return false;
    }
    if (auto *length = mg_http_get_header(&hm, "Content-Length"))
    {
        auto declared = parse_size(to_view(*length));
        return declared &&
               received.size() - static_cast<std::size_t>(header_len) >=
                   *declared;
    }
    auto status = mg_http_status(&hm);
    return status == 204 || status == 304;
}

void exchange_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    auto *exchange = static_cast<Exchange *>(conn->fn_data);
    if (exchange == nullptr)
    {
        return;
    }
    if (ev == MG_EV_CONNECT)
    {
        if (exchange->use_tls)
        {
            struct mg_tls_opts opts{};
            opts.name = mg_str(exchange->tls_host.c_str());
            mg_tls_init(conn, &opts);
        }
        if (!exchange->request_sent)
        {
            mg_send(conn, exchange->request.data(), exchange->request.size());
            exchange->request_sent = true;
        }
    }
    else if (ev == MG_EV_READ)
    {
        exchange->received.append(conn->recv.buf, conn->recv.len);
        mg_iobuf_del(&conn->recv, 0, conn->recv.len);
        if (response_complete(exchange->received))
        {
            exchange->complete = true;
            conn->is_closing = 1;
        }
    }
    else if (ev == MG_EV_ERROR)
    {
        auto const *message = static_cast<char const *>(ev_data);
        exchange->error = message != nullptr ? message : "unknown error";
    }
    else if (ev == MG_EV_CLOSE)
    {
        exchange->closed = true;
    }
}

std::string build_request(HttpRequest const &request, std::string_view host,
                          std::string_view uri)
{
    std::string out;
    out.reserve(256 + request.body.size());
    out += std::format("{} {} HTTP/1.0\r\nHost: {}\r\nUser-Agent: {}\r\n",
                       request.method, uri.empty() ? "/" : uri, host,
                       folio::version::kUserAgentVersion);
    out += "Accept: */*\r\nConnection: close\r\n";
    if (!request.body.empty() || request.method == "POST")
    {
        out += std::format("Content-Type: {}\r\nContent-Length: {}\r\n",
                           request.content_type.empty()
                               ? std::string_view("application/octet-stream")
                               : std::string_view(request.content_type),
                           request.body.size());
    }
    out += "\r\n";
    out += request.body;
    return out;
}

HttpResponse finish_response(std::string const &received)
{
    struct mg_http_message hm{};
    int header_len = mg_http_parse(received.data(), received.size(), &hm);
    if (header_len <= 0)
    {
        throw HttpError("remote disconnected before response");
    }
    HttpResponse response;
    response.status = mg_http_status(&hm);
    std::string_view body(received.data() + header_len,
                          received.size() - static_cast<std::size_t>(header_len));
    if (auto *length = mg_http_get_header(&hm, "Content-Length"))
    {
        if (auto declared = parse_size(to_view(*length)))
        {
            if (body.size() < *declared)
            {
                throw HttpError(std::format(
                    "remote disconnected after {} of {} body bytes",
                    body.size(), *declared));
            }
            body = body.substr(0, *declared);
        }
    }
    if (auto *encoding = mg_http_get_header(&hm, "Transfer-Encoding");
        encoding != nullptr && iequals(to_view(*encoding), "chunked"))
    {
        auto decoded = decode_chunked(body);
        if (!decoded)
        {
            throw HttpError("remote disconnected inside a chunked body");
        }
        response.body = std::move(*decoded);
    }
    else
    {
        response.body.assign(body);
    }
    if (auto *type = mg_http_get_header(&hm, "Content-Type"))
    {
        response.content_type.assign(to_view(*type));
    }
    return response;
}

} // namespace

HttpResponse http_request(HttpRequest const &request)
{
    static std::once_flag quiet_logging;
    std::call_once(quiet_logging, [] { mg_log_set(MG_LL_NONE); });

    auto host = to_view(mg_url_host(request.url.c_str()));
    if (host.empty())
    {
        throw HttpError(std::format("invalid url: {}", request.url));
    }
    Exchange exchange;
    exchange.use_tls = mg_url_is_ssl(request.url.c_str()) != 0;
    exchange.tls_host.assign(host);
    std::string host_header(host);
    if (auto port = mg_url_port(request.url.c_str());
        port != (exchange.use_tls ? 443 : 80))
    {
        host_header += std::format(":{}", port);
    }
    exchange.request =
        build_request(request, host_header, mg_url_uri(request.url.c_str()));

    mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto *conn =
        mg_connect(&mgr, request.url.c_str(), exchange_handler, &exchange);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        throw HttpError(std::format("connection error: cannot connect to {}",
                                    request.url));
    }

    auto deadline = std::chrono::steady_clock::now() + request.timeout;
    bool timed_out = false;
    while (!exchange.complete && !exchange.closed && exchange.error.empty())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            timed_out = true;
            break;
        }
        mg_mgr_poll(&mgr, 50);
    }
    mg_mgr_free(&mgr);

    if (!exchange.error.empty() && !exchange.complete)
    {
        throw HttpError(std::format("connection error: {}", exchange.error));
    }
    if (timed_out)
    {
        throw HttpError(std::format("timeout after {} ms waiting for {}",
                                    request.timeout.count(), request.url));
    }
    auto response = finish_response(exchange.received);
    FOLIO_LOG_DEBUG("{} {} -> {} ({} bytes)", request.method, request.url,
                    response.status, response.body.size());
    return response;
}

} // namespace folio::utils
