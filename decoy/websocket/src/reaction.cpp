#include "decoy/reaction.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "decoy/responder.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

Reaction Reaction::Close(CloseCode code, std::string_view reason) {
  Reaction ret(Kind::close, Message{Opcode::Close, std::string(reason)});
  ret._closeCode = code;
  return ret;
}

Reaction& Reaction::delay(DelaySpec delay) {
  delay.validate();
  _delay = delay;
  return *this;
}

std::string Reaction::describe() const {
  std::string ret;
  if (_kind == Kind::close) {
    ret = fmt::format("close with code {}", static_cast<uint16_t>(_closeCode));
  } else if (_message.isText()) {
    ret = fmt::format("send text \"{}\"", _message.payload);
  } else {
    ret = fmt::format("send {} message of {} bytes", OpcodeStr(_message.opcode), _message.payload.size());
  }
  if (!_delay.isZero()) {
    ret.append(fmt::format(" after {}ms", _delay.min.count()));
    if (_delay.max != _delay.min) {
      ret.append(fmt::format(" to {}ms", _delay.max.count()));
    }
  }
  return ret;
}

}  // namespace decoy::websocket
