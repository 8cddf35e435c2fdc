#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "decoy/named-value.hpp"

namespace decoy {

// Normalized, immutable snapshot of an inbound HTTP request, as handed over by the listener.
// Matchers only read from it.
class RequestView {
 public:
  RequestView() = default;

  // Normalizes a parsed request:
  //  - 'target' is split at the first '?', the path is percent-decoded ('+' kept), the query string is decoded with
  //    form semantics ('+' is a space), keeping duplicated parameters in order.
  //  - cookies are extracted from every 'Cookie' header ("a=1; b=2").
  [[nodiscard]] static RequestView From(std::string_view method, std::string_view target, NamedValues headers,
                                        std::string body = {}, bool secure = false);

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Decoded path.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw (still encoded) query string, without the '?'.
  [[nodiscard]] std::string_view rawQuery() const noexcept { return _rawQuery; }

  // Original, raw request target (path and query as received).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  [[nodiscard]] const NamedValues& queryParams() const noexcept { return _queryParams; }

  [[nodiscard]] const NamedValues& headers() const noexcept { return _headers; }

  [[nodiscard]] const NamedValues& cookies() const noexcept { return _cookies; }

  // Raw body bytes, as received (possibly content-encoded).
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Whether the request arrived through the encrypted listener.
  [[nodiscard]] bool secure() const noexcept { return _secure; }

  // Header lookup, case-insensitive on the name. Returns the first value.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return FindFirstValue(_headers, name, true);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view name) const noexcept {
    return FindFirstValue(_queryParams, name);
  }

  [[nodiscard]] std::optional<std::string_view> cookieValue(std::string_view name) const noexcept {
    return FindFirstValue(_cookies, name);
  }

  // Value of the Content-Type header, or empty.
  [[nodiscard]] std::string_view contentType() const noexcept;

 private:
  std::string _method;
  std::string _target;
  std::string _path;
  std::string _rawQuery;
  NamedValues _queryParams;
  NamedValues _headers;
  NamedValues _cookies;
  std::string _body;
  bool _secure{false};
};

}  // namespace decoy
