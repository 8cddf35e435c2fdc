#include "decoy/sha1.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace decoy {

void Sha1::processBlock(const uint8_t* block) noexcept {
  uint32_t words[80];
  for (std::size_t pos = 0; pos < 16; ++pos) {
    words[pos] = (static_cast<uint32_t>(block[4 * pos]) << 24) | (static_cast<uint32_t>(block[4 * pos + 1]) << 16) |
                 (static_cast<uint32_t>(block[4 * pos + 2]) << 8) | static_cast<uint32_t>(block[4 * pos + 3]);
  }
  for (std::size_t pos = 16; pos < 80; ++pos) {
    words[pos] = std::rotl(words[pos - 3] ^ words[pos - 8] ^ words[pos - 14] ^ words[pos - 16], 1);
  }

  uint32_t a = _state[0];
  uint32_t b = _state[1];
  uint32_t c = _state[2];
  uint32_t d = _state[3];
  uint32_t e = _state[4];
  for (std::size_t pos = 0; pos < 80; ++pos) {
    uint32_t f;
    uint32_t k;
    if (pos < 20) {
      f = (b & c) | (~b & d);
      k = 0x5A827999U;
    } else if (pos < 40) {
      f = b ^ c ^ d;
      k = 0x6ED9EBA1U;
    } else if (pos < 60) {
      f = (b & c) | (b & d) | (c & d);
      k = 0x8F1BBCDCU;
    } else {
      f = b ^ c ^ d;
      k = 0xCA62C1D6U;
    }
    const uint32_t temp = std::rotl(a, 5) + f + e + k + words[pos];
    e = d;
    d = c;
    c = std::rotl(b, 30);
    b = a;
    a = temp;
  }
  _state[0] += a;
  _state[1] += b;
  _state[2] += c;
  _state[3] += d;
  _state[4] += e;
}

void Sha1::update(std::string_view data) noexcept {
  _nbBytes += data.size();
  for (char ch : data) {
    _block[_blockSize++] = static_cast<uint8_t>(ch);
    if (_blockSize == kBlockSize) {
      processBlock(_block.data());
      _blockSize = 0;
    }
  }
}

Sha1Digest Sha1::final() noexcept {
  const uint64_t nbBits = _nbBytes * 8U;
  _block[_blockSize++] = 0x80;
  if (_blockSize > kBlockSize - 8U) {
    while (_blockSize < kBlockSize) {
      _block[_blockSize++] = 0;
    }
    processBlock(_block.data());
    _blockSize = 0;
  }
  while (_blockSize < kBlockSize - 8U) {
    _block[_blockSize++] = 0;
  }
  for (int shift = 56; shift >= 0; shift -= 8) {
    _block[_blockSize++] = static_cast<uint8_t>(nbBits >> shift);
  }
  processBlock(_block.data());
  _blockSize = 0;

  Sha1Digest ret;
  for (std::size_t pos = 0; pos < _state.size(); ++pos) {
    ret[4 * pos] = static_cast<char>(_state[pos] >> 24);
    ret[4 * pos + 1] = static_cast<char>(_state[pos] >> 16);
    ret[4 * pos + 2] = static_cast<char>(_state[pos] >> 8);
    ret[4 * pos + 3] = static_cast<char>(_state[pos]);
  }
  return ret;
}

}  // namespace decoy
