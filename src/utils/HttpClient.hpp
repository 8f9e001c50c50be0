#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace folio::utils
{

struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::string body;
    std::string content_type;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct HttpResponse
{
    int status = 0;
    std::string body;
    std::string content_type;
};

// Transport-level failure (connect, TLS, timeout, truncated response). HTTP
// error statuses are returned, not thrown.
class HttpError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Blocking request on a private mongoose manager; safe to call from several
// threads at once.
HttpResponse http_request(HttpRequest const &request);

} // namespace folio::utils
