#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

using MaskingKey = std::array<uint8_t, kMaskingKeySize>;

// Appends one frame to 'out'. Frames sent by a server are not masked, frames sent by a client are masked with
// 'maskingKey'.
void AppendFrame(std::string& out, Opcode opcode, std::string_view payload, bool fin = true,
                 const MaskingKey* maskingKey = nullptr);

// Appends a Close frame carrying 'code' and 'reason' (truncated to fit a control frame).
void AppendCloseFrame(std::string& out, CloseCode code, std::string_view reason = {},
                      const MaskingKey* maskingKey = nullptr);

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;
};

[[nodiscard]] ClosePayload ParseClosePayload(std::string_view payload) noexcept;

// XOR masking, its own inverse.
void ApplyMask(char* data, std::size_t size, const MaskingKey& maskingKey) noexcept;

// Incremental decoder of a frame stream into messages.
// Fragmented data messages are reassembled, control frames (which may be interleaved with fragments) are returned
// as messages of their own.
// Protocol errors throw std::invalid_argument; the decoder should not be used afterwards.
class FrameDecoder {
 public:
  // 'expectMasked' is true on the server side: frames sent by clients must be masked.
  explicit FrameDecoder(bool expectMasked = true, std::size_t maxMessageSize = kDefaultMaxMessageSize)
      : _maxMessageSize(maxMessageSize), _expectMasked(expectMasked) {}

  void feed(std::string_view bytes) { _buffer.append(bytes); }

  // Returns the next complete message, or std::nullopt if more bytes are needed.
  [[nodiscard]] std::optional<Message> next();

  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _buffer.size(); }

 private:
  std::string _buffer;
  std::string _fragments;
  std::size_t _maxMessageSize;
  Opcode _fragmentedOpcode{Opcode::Continuation};
  bool _expectMasked;
};

}  // namespace decoy::websocket
