#pragma once

#include <array>
#include <string_view>

#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"

namespace decoy {

// Base64 encoded SHA-1 is always 28 chars
using B64EncodedSha1 = std::array<char, 28>;

// A valid key is 24 base64 characters encoding 16 bytes.
[[nodiscard]] bool IsValidWebSocketKey(std::string_view key);

// Sec-WebSocket-Accept value answering 'key' (RFC 6455 §1.3).
[[nodiscard]] B64EncodedSha1 ComputeWebSocketAccept(std::string_view key);

// Whether 'request' is a well formed WebSocket opening handshake (GET, Upgrade: websocket, Connection: upgrade,
// version 13 and a valid key).
[[nodiscard]] bool IsWebSocketUpgrade(const RequestView& request);

// 101 Switching Protocols response accepting the opening handshake 'request'.
// Throws std::invalid_argument if 'request' is not a valid WebSocket upgrade.
[[nodiscard]] ResponseDescription MakeHandshakeResponse(const RequestView& request);

}  // namespace decoy
