#pragma once

#include <condition_variable>
#include <mutex>
#include <string>
#include <string_view>

#include "decoy/timedef.hpp"
#include "decoy/websocket-constants.hpp"
#include "decoy/websocket-message.hpp"

namespace decoy::websocket {

// Outbound side of a WebSocket connection, implemented by the listener.
// Calls for one connection are serialized by its session.
class WebSocketSender {
 public:
  virtual ~WebSocketSender() = default;

  virtual void send(const Message& message) = 0;

  // Sends a Close frame. No message is sent afterwards.
  virtual void close(CloseCode code, std::string_view reason) = 0;
};

// Sender serializing what it is given into unmasked server frames, for listeners writing to a byte stream.
class FrameBufferSender : public WebSocketSender {
 public:
  void send(const Message& message) override;

  void close(CloseCode code, std::string_view reason) override;

  // Returns and clears the frames accumulated so far.
  [[nodiscard]] std::string takeBytes();

  // Like takeBytes(), waiting up to 'timeout' for frames to be available. Returns an empty string on timeout.
  [[nodiscard]] std::string waitBytes(Duration timeout);

  [[nodiscard]] bool isClosed() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::string _bytes;
  bool _closed{false};
};

}  // namespace decoy::websocket
