#include "decoy/websocket-upgrade.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/ascii.hpp"
#include "decoy/base64.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/http-status-code.hpp"
#include "decoy/request-view.hpp"
#include "decoy/response-description.hpp"
#include "decoy/sha1.hpp"
#include "decoy/string-trim.hpp"
#include "decoy/websocket-constants.hpp"

namespace decoy {

namespace {

constexpr bool IsBase64Char(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' ||
         ch == '=';
}

// Connection is a comma separated list of tokens ("keep-alive, Upgrade")
bool HasConnectionToken(std::string_view connection, std::string_view token) {
  while (!connection.empty()) {
    const auto comma = connection.find(',');
    if (CaseInsensitiveEqual(TrimOws(connection.substr(0, comma)), token)) {
      return true;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    connection.remove_prefix(comma + 1);
  }
  return false;
}

}  // namespace

bool IsValidWebSocketKey(std::string_view key) {
  return key.size() == 24 && std::ranges::all_of(key, IsBase64Char) && key[22] == '=' && key[23] == '=';
}

B64EncodedSha1 ComputeWebSocketAccept(std::string_view key) {
  Sha1 sha1;
  sha1.update(key);
  sha1.update(websocket::kGUID);
  const Sha1Digest hash = sha1.final();

  static_assert(B64EncodedLen(sizeof(hash)) == B64EncodedSha1{}.size(), "Unexpected B64EncodedSha1 size");

  B64EncodedSha1 ret;
  B64Encode(std::string_view(hash.data(), hash.size()), ret.data());
  return ret;
}

bool IsWebSocketUpgrade(const RequestView& request) {
  return request.method() == http::GET &&
         CaseInsensitiveEqual(request.headerValueOrEmpty(http::Upgrade), websocket::UpgradeValue) &&
         HasConnectionToken(request.headerValueOrEmpty(http::Connection), http::Upgrade) &&
         request.headerValueOrEmpty(websocket::SecWebSocketVersion) == websocket::kVersion &&
         IsValidWebSocketKey(request.headerValueOrEmpty(websocket::SecWebSocketKey));
}

ResponseDescription MakeHandshakeResponse(const RequestView& request) {
  if (!IsWebSocketUpgrade(request)) {
    throw std::invalid_argument("Not a valid WebSocket opening handshake");
  }
  const auto accept = ComputeWebSocketAccept(request.headerValueOrEmpty(websocket::SecWebSocketKey));
  ResponseDescription response;
  response.status = http::StatusCodeSwitchingProtocols;
  response.headers.emplace_back(std::string(http::Upgrade), std::string(websocket::UpgradeValue));
  response.headers.emplace_back(std::string(http::Connection), std::string(http::Upgrade));
  response.headers.emplace_back(std::string(websocket::SecWebSocketAccept), std::string(accept.data(), accept.size()));
  return response;
}

}  // namespace decoy
