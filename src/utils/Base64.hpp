#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace folio::utils
{

// Standard alphabet, padding optional, embedded whitespace ignored. Returns
// nullopt on any other character.
std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input);

} // namespace folio::utils
