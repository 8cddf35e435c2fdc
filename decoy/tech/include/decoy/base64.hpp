#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace decoy {

// Size of the padded base64 text of 'nbBytes' bytes.
constexpr std::size_t B64EncodedLen(std::size_t nbBytes) noexcept { return (nbBytes + 2) / 3 * 4; }

// Writes exactly B64EncodedLen(data.size()) chars at 'out', padding included.
void B64Encode(std::string_view data, char* out) noexcept;

[[nodiscard]] std::string B64Encode(std::string_view data);

}  // namespace decoy
