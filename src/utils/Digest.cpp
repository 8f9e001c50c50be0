#include "utils/Digest.hpp"

#include "utils/Log.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace folio::utils
{

namespace
{

constexpr std::size_t kReadChunkBytes = 64 * 1024;

struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX *ctx) const noexcept
    {
        EVP_MD_CTX_free(ctx);
    }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext start_sha256()
{
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        return nullptr;
    }
    return ctx;
}

std::optional<std::string> finish_sha256(EVP_MD_CTX *ctx)
{
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1)
    {
        return std::nullopt;
    }
    return to_hex(std::span<std::uint8_t const>(digest.data(), length));
}

} // namespace

std::string to_hex(std::span<std::uint8_t const> data)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto byte : data)
    {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

std::string sha256_bytes(std::span<std::uint8_t const> data)
{
    auto ctx = start_sha256();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("sha256 context initialization failed");
    }
    auto hex = finish_sha256(ctx.get());
    if (!hex)
    {
        throw std::runtime_error("sha256 finalization failed");
    }
    return *hex;
}

std::string sha256_bytes(std::string_view data)
{
    return sha256_bytes(std::span<std::uint8_t const>(
        reinterpret_cast<std::uint8_t const *>(data.data()), data.size()));
}

std::optional<std::string> sha256_file(std::filesystem::path const &path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        FOLIO_LOG_DEBUG("sha256: cannot open {}", path.string());
        return std::nullopt;
    }
    auto ctx = start_sha256();
    if (!ctx)
    {
        FOLIO_LOG_ERROR("sha256: digest context unavailable");
        return std::nullopt;
    }
    std::array<char, kReadChunkBytes> chunk{};
    while (input)
    {
        input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto got = input.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), chunk.data(),
                             static_cast<std::size_t>(got)) != 1)
        {
            return std::nullopt;
        }
    }
    if (input.bad())
    {
        FOLIO_LOG_WARN("sha256: read error on {}", path.string());
        return std::nullopt;
    }
    return finish_sha256(ctx.get());
}

} // namespace folio::utils
