#include "utils/Base64.hpp"

#include <array>
#include <cctype>

namespace folio::utils
{

namespace
{
constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<std::int8_t, 256> const &lookup_table()
{
    static const std::array<std::int8_t, 256> table = []
    {
        std::array<std::int8_t, 256> built{};
        built.fill(-1);
        for (int i = 0; kAlphabet[i] != '\0'; ++i)
        {
            built[static_cast<std::uint8_t>(kAlphabet[i])] =
                static_cast<std::int8_t>(i);
        }
        return built;
    }();
    return table;
}
} // namespace

std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input)
{
    auto const &table = lookup_table();
    std::vector<std::uint8_t> bytes;
    bytes.reserve((input.size() / 4) * 3 + 3);
    std::uint32_t accumulator = 0;
    int pending_bits = 0;
    bool padding_seen = false;
    for (char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        if (ch == '=')
        {
            padding_seen = true;
            continue;
        }
        if (padding_seen)
        {
            // data after padding
            return std::nullopt;
        }
        auto sextet = table[static_cast<std::uint8_t>(ch)];
        if (sextet < 0)
        {
            return std::nullopt;
        }
        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(sextet);
        pending_bits += 6;
        if (pending_bits >= 8)
        {
            pending_bits -= 8;
            bytes.push_back(
                static_cast<std::uint8_t>((accumulator >> pending_bits) & 0xFF));
        }
    }
    return bytes;
}

} // namespace folio::utils
