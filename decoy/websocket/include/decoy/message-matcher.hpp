#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "decoy/value-matcher.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

// Predicate over an inbound WebSocket data message.
class MessageMatcher {
 public:
  using Predicate = std::function<bool(const Message&)>;

  // Any data message.
  [[nodiscard]] static MessageMatcher Any() { return MessageMatcher(AnyOf{}); }

  // Any data message of type 'opcode' (text or binary).
  [[nodiscard]] static MessageMatcher OfType(Opcode opcode);

  // Text message whose payload satisfies 'valueMatcher'.
  [[nodiscard]] static MessageMatcher Text(ValueMatcher valueMatcher) {
    return MessageMatcher(TextSpec{std::move(valueMatcher)});
  }

  [[nodiscard]] static MessageMatcher Text(std::string_view text) { return Text(ValueMatcher::Equals(text)); }

  // Binary message whose payload is exactly 'bytes'.
  [[nodiscard]] static MessageMatcher Binary(std::string_view bytes) {
    return MessageMatcher(BinarySpec{std::string(bytes)});
  }

  // Throws std::invalid_argument if 'predicate' is empty.
  [[nodiscard]] static MessageMatcher Satisfies(Predicate predicate, std::string_view description);

  // Exceptions thrown by a predicate are logged and make the matcher fail.
  [[nodiscard]] bool matches(const Message& message) const noexcept;

  [[nodiscard]] std::string describe() const;

 private:
  struct AnyOf {
    // Continuation means any data message
    Opcode opcode{Opcode::Continuation};
  };
  struct TextSpec {
    ValueMatcher valueMatcher;
  };
  struct BinarySpec {
    std::string bytes;
  };
  struct PredicateSpec {
    Predicate predicate;
    std::string description;
  };

  using Data = std::variant<AnyOf, TextSpec, BinarySpec, PredicateSpec>;

  explicit MessageMatcher(Data data) : _data(std::move(data)) {}

  Data _data;
};

}  // namespace decoy::websocket
