#include "decoy/message-matcher.hpp"

#include <spdlog/fmt/fmt.h>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "decoy/log.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

namespace {

bool IsDataMessage(const Message& message) {
  return message.opcode == Opcode::Text || message.opcode == Opcode::Binary;
}

}  // namespace

MessageMatcher MessageMatcher::OfType(Opcode opcode) {
  if (opcode != Opcode::Text && opcode != Opcode::Binary) {
    throw std::invalid_argument(fmt::format("Cannot match messages of type {}", OpcodeStr(opcode)));
  }
  return MessageMatcher(AnyOf{opcode});
}

MessageMatcher MessageMatcher::Satisfies(Predicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("Message predicate cannot be empty");
  }
  return MessageMatcher(PredicateSpec{std::move(predicate), std::string(description)});
}

bool MessageMatcher::matches(const Message& message) const noexcept {
  if (!IsDataMessage(message)) {
    return false;
  }
  try {
    return std::visit(
        [&message](const auto& data) -> bool {
          using T = std::decay_t<decltype(data)>;
          if constexpr (std::is_same_v<T, AnyOf>) {
            return data.opcode == Opcode::Continuation || data.opcode == message.opcode;
          } else if constexpr (std::is_same_v<T, TextSpec>) {
            return message.isText() && data.valueMatcher.test(std::optional<std::string_view>(message.payload));
          } else if constexpr (std::is_same_v<T, BinarySpec>) {
            return message.isBinary() && message.payload == data.bytes;
          } else {
            return data.predicate(message);
          }
        },
        _data);
  } catch (const std::exception& ex) {
    log::debug("Message matcher '{}' failed: {}", describe(), ex.what());
  } catch (...) {
    log::debug("Message matcher failed with an unknown exception");
  }
  return false;
}

std::string MessageMatcher::describe() const {
  return std::visit(
      [](const auto& data) -> std::string {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, AnyOf>) {
          if (data.opcode == Opcode::Continuation) {
            return "any message";
          }
          return fmt::format("any {} message", OpcodeStr(data.opcode));
        } else if constexpr (std::is_same_v<T, TextSpec>) {
          return fmt::format("text message {}", data.valueMatcher.describe());
        } else if constexpr (std::is_same_v<T, BinarySpec>) {
          return fmt::format("binary message of {} bytes", data.bytes.size());
        } else {
          return fmt::format("message satisfies {}", data.description);
        }
      },
      _data);
}

}  // namespace decoy::websocket
