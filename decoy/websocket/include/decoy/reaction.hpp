#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/responder.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

// What to send back on a WebSocket connection: a message, or a Close frame ending the connection.
class Reaction {
 public:
  enum class Kind : uint8_t { message, close };

  [[nodiscard]] static Reaction Send(Message message) { return Reaction(Kind::message, std::move(message)); }

  [[nodiscard]] static Reaction Text(std::string_view text) { return Send(Message::Text(text)); }

  [[nodiscard]] static Reaction Binary(std::string_view bytes) { return Send(Message::Binary(bytes)); }

  [[nodiscard]] static Reaction Close(CloseCode code = CloseCode::Normal, std::string_view reason = {});

  // Pause before sending. Throws std::invalid_argument on an invalid delay.
  Reaction& delay(DelaySpec delay);

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  // Message to send (kind message), close reason (kind close).
  [[nodiscard]] const Message& message() const noexcept { return _message; }

  [[nodiscard]] CloseCode closeCode() const noexcept { return _closeCode; }

  [[nodiscard]] const DelaySpec& delaySpec() const noexcept { return _delay; }

  [[nodiscard]] std::string describe() const;

 private:
  Reaction(Kind kind, Message message) : _message(std::move(message)), _kind(kind) {}

  Message _message;
  DelaySpec _delay;
  CloseCode _closeCode{CloseCode::Normal};
  Kind _kind;
};

}  // namespace decoy::websocket
