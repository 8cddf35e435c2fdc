#include "decoy/websocket-frame.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

namespace {

[[noreturn]] void ProtocolError(std::string_view reason) {
  throw std::invalid_argument(fmt::format("WebSocket protocol error: {}", reason));
}

uint8_t Byte(std::string_view data, std::size_t pos) { return static_cast<uint8_t>(data[pos]); }

}  // namespace

void ApplyMask(char* data, std::size_t size, const MaskingKey& maskingKey) noexcept {
  for (std::size_t pos = 0; pos < size; ++pos) {
    data[pos] = static_cast<char>(static_cast<uint8_t>(data[pos]) ^ maskingKey[pos % kMaskingKeySize]);
  }
}

void AppendFrame(std::string& out, Opcode opcode, std::string_view payload, bool fin, const MaskingKey* maskingKey) {
  const std::size_t payloadSize = payload.size();
  out.reserve(out.size() + kMinFrameHeaderSize + 8U + kMaskingKeySize + payloadSize);

  out.push_back(static_cast<char>(static_cast<uint8_t>(opcode) | (fin ? kFinBit : 0U)));

  const uint8_t maskBit = maskingKey == nullptr ? 0U : kMaskBit;
  if (payloadSize < kPayloadLen16) {
    out.push_back(static_cast<char>(maskBit | static_cast<uint8_t>(payloadSize)));
  } else if (payloadSize <= 0xFFFF) {
    out.push_back(static_cast<char>(maskBit | kPayloadLen16));
    // 16-bit big-endian length
    out.push_back(static_cast<char>((payloadSize >> 8) & 0xFF));
    out.push_back(static_cast<char>(payloadSize & 0xFF));
  } else {
    out.push_back(static_cast<char>(maskBit | kPayloadLen64));
    // 64-bit big-endian length
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((static_cast<uint64_t>(payloadSize) >> shift) & 0xFF));
    }
  }

  if (maskingKey == nullptr) {
    out.append(payload);
    return;
  }
  for (uint8_t keyByte : *maskingKey) {
    out.push_back(static_cast<char>(keyByte));
  }
  const std::size_t payloadStart = out.size();
  out.append(payload);
  ApplyMask(out.data() + payloadStart, payloadSize, *maskingKey);
}

void AppendCloseFrame(std::string& out, CloseCode code, std::string_view reason, const MaskingKey* maskingKey) {
  std::string payload;
  if (code != CloseCode::NoStatusReceived) {
    const auto codeVal = static_cast<uint16_t>(code);
    payload.push_back(static_cast<char>((codeVal >> 8) & 0xFF));
    payload.push_back(static_cast<char>(codeVal & 0xFF));
    payload.append(reason.substr(0, kMaxControlFramePayload - 2U));
  }
  AppendFrame(out, Opcode::Close, payload, true, maskingKey);
}

ClosePayload ParseClosePayload(std::string_view payload) noexcept {
  ClosePayload ret;
  if (payload.size() >= 2) {
    ret.code = static_cast<CloseCode>((static_cast<uint16_t>(Byte(payload, 0)) << 8) | Byte(payload, 1));
    ret.reason = payload.substr(2);
  } else if (!payload.empty()) {
    // a single byte is invalid
    ret.code = CloseCode::ProtocolError;
  }
  return ret;
}

std::optional<Message> FrameDecoder::next() {
  while (true) {
    const std::string_view data(_buffer);
    if (data.size() < kMinFrameHeaderSize) {
      return std::nullopt;
    }
    const uint8_t byte0 = Byte(data, 0);
    const uint8_t byte1 = Byte(data, 1);
    const bool fin = (byte0 & kFinBit) != 0;
    if ((byte0 & kRsvBits) != 0) {
      ProtocolError("reserved bits must be 0");
    }
    const uint8_t rawOpcode = byte0 & kOpcodeMask;
    if (!IsKnownOpcode(rawOpcode)) {
      ProtocolError("reserved opcode");
    }
    const auto opcode = static_cast<Opcode>(rawOpcode);
    if (IsControlFrame(opcode) && !fin) {
      ProtocolError("control frames must not be fragmented");
    }
    const bool masked = (byte1 & kMaskBit) != 0;
    if (masked != _expectMasked) {
      ProtocolError(_expectMasked ? "client frames must be masked" : "server frames must not be masked");
    }

    std::size_t offset = kMinFrameHeaderSize;
    uint64_t payloadLength = byte1 & kPayloadLenMask;
    if (payloadLength == kPayloadLen16) {
      if (data.size() < offset + 2U) {
        return std::nullopt;
      }
      payloadLength = (static_cast<uint64_t>(Byte(data, offset)) << 8) | Byte(data, offset + 1U);
      offset += 2U;
    } else if (payloadLength == kPayloadLen64) {
      if (data.size() < offset + 8U) {
        return std::nullopt;
      }
      payloadLength = 0;
      for (std::size_t pos = 0; pos < 8U; ++pos) {
        payloadLength = (payloadLength << 8) | Byte(data, offset + pos);
      }
      offset += 8U;
      if ((payloadLength >> 63) != 0) {
        ProtocolError("invalid payload length");
      }
    }
    if (IsControlFrame(opcode) && payloadLength > kMaxControlFramePayload) {
      ProtocolError("control frame payload too large");
    }
    if (_maxMessageSize != 0 && _fragments.size() + payloadLength > _maxMessageSize) {
      ProtocolError("message too big");
    }

    MaskingKey maskingKey{};
    if (masked) {
      if (data.size() < offset + kMaskingKeySize) {
        return std::nullopt;
      }
      for (std::size_t pos = 0; pos < kMaskingKeySize; ++pos) {
        maskingKey[pos] = Byte(data, offset + pos);
      }
      offset += kMaskingKeySize;
    }
    if (data.size() - offset < payloadLength) {
      return std::nullopt;
    }

    std::string payload(data.substr(offset, static_cast<std::size_t>(payloadLength)));
    _buffer.erase(0, offset + static_cast<std::size_t>(payloadLength));
    if (masked) {
      ApplyMask(payload.data(), payload.size(), maskingKey);
    }

    if (IsControlFrame(opcode)) {
      return Message{opcode, std::move(payload)};
    }
    if (opcode == Opcode::Continuation) {
      if (_fragmentedOpcode == Opcode::Continuation) {
        ProtocolError("continuation frame without a started message");
      }
      _fragments.append(payload);
      if (!fin) {
        continue;
      }
      Message message{std::exchange(_fragmentedOpcode, Opcode::Continuation), std::move(_fragments)};
      _fragments.clear();
      return message;
    }
    if (_fragmentedOpcode != Opcode::Continuation) {
      ProtocolError("new data frame while a fragmented message is in progress");
    }
    if (fin) {
      return Message{opcode, std::move(payload)};
    }
    _fragmentedOpcode = opcode;
    _fragments = std::move(payload);
  }
}

}  // namespace decoy::websocket
