#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace decoy::websocket {

// Magic GUID of the Sec-WebSocket-Accept computation (RFC 6455 §1.3)
inline constexpr std::string_view kGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline constexpr std::string_view kVersion = "13";

inline constexpr std::string_view SecWebSocketKey = "Sec-WebSocket-Key";
inline constexpr std::string_view SecWebSocketAccept = "Sec-WebSocket-Accept";
inline constexpr std::string_view SecWebSocketVersion = "Sec-WebSocket-Version";

// Value of the Upgrade header
inline constexpr std::string_view UpgradeValue = "websocket";

// Frame opcodes (RFC 6455 §5.2)
enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

[[nodiscard]] constexpr bool IsKnownOpcode(uint8_t rawOpcode) noexcept {
  return rawOpcode <= 0x2 || (rawOpcode >= 0x8 && rawOpcode <= 0xA);
}

[[nodiscard]] constexpr std::string_view OpcodeStr(Opcode op) noexcept {
  switch (op) {
    case Opcode::Continuation:
      return "continuation";
    case Opcode::Text:
      return "text";
    case Opcode::Binary:
      return "binary";
    case Opcode::Close:
      return "close";
    case Opcode::Ping:
      return "ping";
    case Opcode::Pong:
      return "pong";
    default:
      return "unknown";
  }
}

// Close status codes (RFC 6455 §7.4.1)
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  ProtocolError = 1002,
  UnsupportedData = 1003,
  NoStatusReceived = 1005,
  InvalidPayloadData = 1007,
  PolicyViolation = 1008,
  MessageTooBig = 1009,
  InternalError = 1011,
};

// First byte of a frame: FIN | RSV1 | RSV2 | RSV3 | OPCODE (4 bits)
inline constexpr uint8_t kFinBit = 0x80;
inline constexpr uint8_t kRsvBits = 0x70;
inline constexpr uint8_t kOpcodeMask = 0x0F;

// Second byte: MASK | payload length (7 bits)
inline constexpr uint8_t kMaskBit = 0x80;
inline constexpr uint8_t kPayloadLenMask = 0x7F;

// Extended payload length indicators
inline constexpr uint8_t kPayloadLen16 = 126;
inline constexpr uint8_t kPayloadLen64 = 127;

inline constexpr std::size_t kMaxControlFramePayload = 125;
inline constexpr std::size_t kMaskingKeySize = 4;
inline constexpr std::size_t kMinFrameHeaderSize = 2;

inline constexpr std::size_t kDefaultMaxMessageSize = 16UL * 1024UL * 1024UL;

}  // namespace decoy::websocket
