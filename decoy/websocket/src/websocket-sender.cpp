#include "decoy/websocket-sender.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/timedef.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-frame.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

void FrameBufferSender::send(const Message& message) {
  std::scoped_lock lock(_mutex);
  if (_closed) {
    throw std::logic_error("Cannot send a message after the Close frame");
  }
  AppendFrame(_bytes, message.opcode, message.payload);
  _cv.notify_all();
}

void FrameBufferSender::close(CloseCode code, std::string_view reason) {
  std::scoped_lock lock(_mutex);
  if (_closed) {
    return;
  }
  AppendCloseFrame(_bytes, code, reason);
  _closed = true;
  _cv.notify_all();
}

std::string FrameBufferSender::takeBytes() {
  std::scoped_lock lock(_mutex);
  return std::exchange(_bytes, {});
}

std::string FrameBufferSender::waitBytes(Duration timeout) {
  std::unique_lock lock(_mutex);
  _cv.wait_for(lock, timeout, [this] { return !_bytes.empty(); });
  return std::exchange(_bytes, {});
}

bool FrameBufferSender::isClosed() const {
  std::scoped_lock lock(_mutex);
  return _closed;
}

}  // namespace decoy::websocket
