#pragma once

#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/named-value.hpp"

namespace decoy {

// Opaque bytes. Decoded from any content type without a more specific decoder, encoded as is.
struct Bytes {
  std::string data;

  bool operator==(const Bytes&) const noexcept = default;
};

// Decoded application/x-www-form-urlencoded body.
struct FormParams {
  NamedValues params;

  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept {
    return FindFirstValue(params, name);
  }

  bool operator==(const FormParams&) const noexcept = default;
};

// Binary data sent as its base64 text representation.
struct Base64Bytes {
  std::string data;
};

// Response body read from a file at encoding time.
struct FileSource {
  std::filesystem::path path;
};

// Response body read from an input stream at encoding time.
// 'open' is called once per response and the stream it returns is read to its end, so that responses served
// concurrently never share a read position.
struct StreamSource {
  std::function<std::unique_ptr<std::istream>()> open;
};

// Response body read from a URL at encoding time. Only the 'file' scheme is supported.
struct UrlSource {
  std::string url;
};

}  // namespace decoy
