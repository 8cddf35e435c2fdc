#pragma once

#include <string>
#include <string_view>

#include "decoy/websocket-constants.hpp"

namespace decoy::websocket {

// A complete (reassembled) WebSocket message, or a control frame.
struct Message {
  [[nodiscard]] static Message Text(std::string_view text) { return {Opcode::Text, std::string(text)}; }

  [[nodiscard]] static Message Binary(std::string_view bytes) { return {Opcode::Binary, std::string(bytes)}; }

  [[nodiscard]] bool isText() const noexcept { return opcode == Opcode::Text; }

  [[nodiscard]] bool isBinary() const noexcept { return opcode == Opcode::Binary; }

  bool operator==(const Message&) const noexcept = default;

  Opcode opcode{Opcode::Text};
  std::string payload;
};

}  // namespace decoy::websocket
