#include "engine/DiagramService.hpp"

#include "utils/HttpClient.hpp"

#include <zlib.h>

#include <format>

namespace folio::engine
{

namespace
{

constexpr char const kAlphabet[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz-_";

std::string deflate_raw(std::string_view text)
{
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
    {
        throw DiagramServiceError("cannot initialise the PlantUML compressor");
    }
    std::string out(deflateBound(&stream, static_cast<uLong>(text.size())),
                    '\0');
    stream.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(text.data()));
    stream.avail_in = static_cast<uInt>(text.size());
    stream.next_out = reinterpret_cast<Bytef *>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&stream, Z_FINISH);
    auto produced = stream.total_out;
    deflateEnd(&stream);
    if (rc != Z_STREAM_END)
    {
        throw DiagramServiceError(
            std::format("PlantUML compression failed ({})", rc));
    }
    out.resize(produced);
    return out;
}

} // namespace

std::string plantuml_encode(std::string_view source)
{
    auto packed = deflate_raw(source);
    std::string out;
    out.reserve((packed.size() + 2) / 3 * 4);
    for (std::size_t i = 0; i < packed.size(); i += 3)
    {
        auto byte_at = [&packed](std::size_t index) -> unsigned
        {
            return index < packed.size()
                       ? static_cast<unsigned char>(packed[index])
                       : 0U;
        };
        unsigned b1 = byte_at(i);
        unsigned b2 = byte_at(i + 1);
        unsigned b3 = byte_at(i + 2);
        out.push_back(kAlphabet[b1 >> 2]);
        out.push_back(kAlphabet[((b1 & 0x3) << 4) | (b2 >> 4)]);
        out.push_back(kAlphabet[((b2 & 0xF) << 2) | (b3 >> 6)]);
        out.push_back(kAlphabet[b3 & 0x3F]);
    }
    return out;
}

PlantUmlClient::PlantUmlClient(std::string server,
                               std::chrono::milliseconds timeout)
    : server_(std::move(server)), timeout_(timeout)
{
    while (!server_.empty() && server_.back() == '/')
    {
        server_.pop_back();
    }
}

std::string PlantUmlClient::request_url(std::string_view source) const
{
    return std::format("{}/png/{}", server_, plantuml_encode(source));
}

std::vector<std::uint8_t> PlantUmlClient::render_png(std::string const &source)
{
    folio::utils::HttpRequest request;
    request.url = request_url(source);
    request.timeout = timeout_;
    auto response = folio::utils::http_request(request);
    if (response.status != 200)
    {
        throw DiagramServiceError(std::format(
            "PlantUML server returned HTTP {}", response.status));
    }
    if (response.body.empty())
    {
        throw DiagramServiceError("PlantUML server returned an empty body");
    }
    return std::vector<std::uint8_t>(response.body.begin(),
                                     response.body.end());
}

} // namespace folio::engine
