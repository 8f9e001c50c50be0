#include "engine/DiagramService.hpp"

#include <zlib.h>

#include <array>
#include <format>
#include <optional>
#include <string>

#include <doctest/doctest.h>

namespace
{

constexpr std::string_view kAlphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz-_";

// Reverses plantuml_encode so the tests can check what the server decodes.
std::optional<std::string> decode(std::string_view encoded)
{
    if (encoded.size() % 4 != 0)
    {
        return std::nullopt;
    }
    std::string packed;
    for (std::size_t i = 0; i < encoded.size(); i += 4)
    {
        std::array<unsigned, 4> six{};
        for (std::size_t k = 0; k < 4; ++k)
        {
            auto pos = kAlphabet.find(encoded[i + k]);
            if (pos == std::string_view::npos)
            {
                return std::nullopt;
            }
            six[k] = static_cast<unsigned>(pos);
        }
        packed.push_back(static_cast<char>((six[0] << 2) | (six[1] >> 4)));
        packed.push_back(
            static_cast<char>(((six[1] & 0xF) << 4) | (six[2] >> 2)));
        packed.push_back(static_cast<char>(((six[2] & 0x3) << 6) | six[3]));
    }

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
    {
        return std::nullopt;
    }
    std::string out(1 << 20, '\0');
    stream.next_in = reinterpret_cast<Bytef *>(packed.data());
    stream.avail_in = static_cast<uInt>(packed.size());
    stream.next_out = reinterpret_cast<Bytef *>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    int rc = inflate(&stream, Z_FINISH);
    auto produced = stream.total_out;
    inflateEnd(&stream);
    if (rc != Z_STREAM_END)
    {
        return std::nullopt;
    }
    out.resize(produced);
    return out;
}

} // namespace

TEST_CASE("plantuml_encode uses the server alphabet")
{
    auto encoded = folio::engine::plantuml_encode("A -> B");
    CHECK(encoded == "SrJGjLDm0W00");
    CHECK(encoded.find_first_not_of(kAlphabet) == std::string::npos);
    CHECK(decode(encoded) == std::optional<std::string>("A -> B"));
}

TEST_CASE("plantuml_encode keeps large diagrams compact")
{
    std::string source = "@startuml\n";
    for (int i = 0; source.size() < 4096; ++i)
    {
        source += std::format("participant P{0}\nP{0} -> Hub : request {0}\n"
                              "Hub --> P{0} : reply\n",
                              i);
    }
    source += "@enduml\n";

    auto encoded = folio::engine::plantuml_encode(source);
    CHECK(encoded.size() < source.size());
    CHECK(encoded.size() % 4 == 0);
    CHECK(decode(encoded) == std::optional<std::string>(source));
}

TEST_CASE("plantuml_encode carries UTF-8 text unchanged")
{
    std::string source = "@startuml\nAlice -> Bob : h\xC3\xA9llo \xE2\x86\x92\n@enduml";
    CHECK(decode(folio::engine::plantuml_encode(source)) ==
          std::optional<std::string>(source));
}
