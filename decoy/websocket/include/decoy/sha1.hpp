#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace decoy {

using Sha1Digest = std::array<char, 20>;

// Incremental SHA-1 (FIPS 180-4). Only used for the WebSocket handshake, not for anything security related.
class Sha1 {
 public:
  Sha1() noexcept = default;

  void update(std::string_view data) noexcept;

  // Finishes the computation. The object should not be updated afterwards.
  [[nodiscard]] Sha1Digest final() noexcept;

  [[nodiscard]] static Sha1Digest Digest(std::string_view data) noexcept {
    Sha1 sha1;
    sha1.update(data);
    return sha1.final();
  }

 private:
  static constexpr std::size_t kBlockSize = 64;

  void processBlock(const uint8_t* block) noexcept;

  std::array<uint32_t, 5> _state{0x67452301U, 0xEFCDAB89U, 0x98BADCFEU, 0x10325476U, 0xC3D2E1F0U};
  std::array<uint8_t, kBlockSize> _block{};
  uint64_t _nbBytes{0};
  std::size_t _blockSize{0};
};

}  // namespace decoy
