#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> folio_appdata_root();

std::optional<std::string> read_text_file(std::filesystem::path const &path);
std::optional<std::vector<std::uint8_t>>
read_binary_file(std::filesystem::path const &path);

// Writes through a sibling temporary file and renames it over the target so
// a crash never leaves a half-written artifact behind.
bool write_file_atomic(std::filesystem::path const &path,
                       std::string_view contents);
bool write_file_atomic(std::filesystem::path const &path,
                       std::vector<std::uint8_t> const &contents);

bool ensure_directory(std::filesystem::path const &path);
bool is_nonempty_file(std::filesystem::path const &path);

} // namespace folio::utils
