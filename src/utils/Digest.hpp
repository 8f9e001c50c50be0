#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace folio::utils
{

// Lowercase hex SHA-256 (64 characters).
std::string sha256_bytes(std::span<std::uint8_t const> data);
std::string sha256_bytes(std::string_view data);

// Streams the file in fixed-size chunks; nullopt when it cannot be read.
std::optional<std::string> sha256_file(std::filesystem::path const &path);

std::string to_hex(std::span<std::uint8_t const> data);

} // namespace folio::utils
