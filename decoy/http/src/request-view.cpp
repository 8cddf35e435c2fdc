#include "decoy/request-view.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "decoy/ascii.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/named-value.hpp"
#include "decoy/string-trim.hpp"
#include "decoy/url-decode.hpp"

namespace decoy {

namespace {

void AppendCookies(std::string_view cookieHeader, NamedValues& cookies) {
  while (!cookieHeader.empty()) {
    const auto semicolon = cookieHeader.find(';');
    const auto pair = TrimOws(cookieHeader.substr(0, semicolon));
    cookieHeader = semicolon == std::string_view::npos ? std::string_view{} : cookieHeader.substr(semicolon + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      // not a cookie-pair, ignore it like user agents do
      continue;
    }
    const auto name = TrimOws(pair.substr(0, eq));
    if (name.empty()) {
      continue;
    }
    cookies.emplace_back(std::string(name), std::string(StripQuotes(TrimOws(pair.substr(eq + 1)))));
  }
}

}  // namespace

RequestView RequestView::From(std::string_view method, std::string_view target, NamedValues headers,
                              std::string body, bool secure) {
  RequestView ret;
  ret._method = method;
  ret._target = target;

  const auto questionMark = target.find('?');
  auto rawPath = target.substr(0, questionMark);
  // fragments are never sent by clients, but strip them if present
  rawPath = rawPath.substr(0, rawPath.find('#'));
  ret._path = url::DecodeComponent(rawPath, false);
  if (questionMark != std::string_view::npos) {
    auto rawQuery = target.substr(questionMark + 1);
    rawQuery = rawQuery.substr(0, rawQuery.find('#'));
    ret._rawQuery = rawQuery;
    url::ForEachFormPair(rawQuery, [&ret](std::string key, std::string value) {
      ret._queryParams.emplace_back(std::move(key), std::move(value));
    });
  }

  for (const auto& header : headers) {
    if (CaseInsensitiveEqual(header.name, http::Cookie)) {
      AppendCookies(header.value, ret._cookies);
    }
  }
  ret._headers = std::move(headers);
  ret._body = std::move(body);
  ret._secure = secure;
  return ret;
}

std::string_view RequestView::contentType() const noexcept { return headerValueOrEmpty(http::ContentType); }

}  // namespace decoy
