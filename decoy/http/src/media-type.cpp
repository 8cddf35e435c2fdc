#include "decoy/media-type.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/ascii.hpp"
#include "decoy/string-trim.hpp"

namespace decoy {

namespace {

constexpr bool IsTokenChar(char ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  static constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return kSpecials.contains(ch);
}

constexpr bool IsToken(std::string_view str) { return !str.empty() && std::ranges::all_of(str, IsTokenChar); }

}  // namespace

std::optional<MediaType> MediaType::Parse(std::string_view str) {
  const auto semicolon = str.find(';');
  const auto essence = TrimOws(str.substr(0, semicolon));
  const auto slash = essence.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }
  const auto type = essence.substr(0, slash);
  const auto subtype = essence.substr(slash + 1);
  if (!IsToken(type) || !IsToken(subtype)) {
    return std::nullopt;
  }
  MediaType ret{AsciiLowerCopy(type), AsciiLowerCopy(subtype), {}};

  std::string_view params = semicolon == std::string_view::npos ? std::string_view{} : str.substr(semicolon + 1);
  while (!params.empty()) {
    std::string_view param;
    auto eq = params.find('=');
    if (eq == std::string_view::npos) {
      param = params;
      params = {};
      if (TrimOws(param).empty()) {
        break;
      }
      return std::nullopt;
    }
    const auto name = TrimOws(params.substr(0, eq));
    params.remove_prefix(eq + 1);
    std::string_view value;
    std::string unquoted;
    params = TrimOws(params);
    if (!params.empty() && params.front() == '"') {
      // quoted-string, honoring backslash escapes
      std::size_t pos = 1;
      for (; pos < params.size() && params[pos] != '"'; ++pos) {
        if (params[pos] == '\\' && pos + 1 < params.size()) {
          ++pos;
        }
        unquoted.push_back(params[pos]);
      }
      if (pos == params.size()) {
        return std::nullopt;
      }
      value = unquoted;
      params.remove_prefix(pos + 1);
      const auto next = params.find(';');
      if (!TrimOws(params.substr(0, next)).empty()) {
        return std::nullopt;
      }
      params = next == std::string_view::npos ? std::string_view{} : params.substr(next + 1);
    } else {
      const auto next = params.find(';');
      value = TrimOws(params.substr(0, next));
      params = next == std::string_view::npos ? std::string_view{} : params.substr(next + 1);
    }
    if (!IsToken(name)) {
      return std::nullopt;
    }
    ret.params.emplace_back(AsciiLowerCopy(name), std::string(value));
  }
  return ret;
}

MediaType MediaType::ParseOrThrow(std::string_view str) {
  auto ret = Parse(str);
  if (!ret) {
    throw std::invalid_argument(fmt::format("Invalid media type '{}'", str));
  }
  return std::move(*ret);
}

std::string MediaType::essence() const {
  std::string ret;
  ret.reserve(type.size() + 1U + subtype.size());
  ret.append(type).append(1, '/').append(subtype);
  return ret;
}

std::optional<std::string_view> MediaType::param(std::string_view name) const noexcept {
  return FindFirstValue(params, name, true);
}

std::string MediaType::charset() const {
  auto value = param("charset");
  return value ? AsciiLowerCopy(*value) : std::string{};
}

MediaRangeMatch MatchMediaRange(std::string_view range, const MediaType& mediaType) {
  range = TrimOws(range.substr(0, range.find(';')));
  const auto slash = range.find('/');
  if (slash == std::string_view::npos) {
    return MediaRangeMatch::none;
  }
  const auto type = range.substr(0, slash);
  const auto subtype = range.substr(slash + 1);
  if (type == "*") {
    return subtype == "*" ? MediaRangeMatch::any : MediaRangeMatch::none;
  }
  if (!CaseInsensitiveEqual(type, mediaType.type)) {
    return MediaRangeMatch::none;
  }
  if (subtype == "*") {
    return MediaRangeMatch::typeWildcard;
  }
  return CaseInsensitiveEqual(subtype, mediaType.subtype) ? MediaRangeMatch::exact : MediaRangeMatch::none;
}

bool IsValidMediaRange(std::string_view range) {
  auto parsed = MediaType::Parse(range);
  if (!parsed) {
    return false;
  }
  if (parsed->type == "*") {
    return parsed->subtype == "*";
  }
  return true;
}

}  // namespace decoy
