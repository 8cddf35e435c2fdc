#include "decoy/http-method.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

namespace decoy::http {

namespace {
constexpr std::string_view kTokens[] = {"GET", "HEAD", "POST", "PUT", "DELETE", "CONNECT", "OPTIONS", "TRACE", "PATCH"};

static_assert(std::size(kTokens) == std::size(kAllMethods));
}  // namespace

std::string_view MethodToStr(Method method) noexcept { return kTokens[static_cast<std::size_t>(method)]; }

std::optional<Method> MethodFromStr(std::string_view str) noexcept {
  for (std::size_t pos = 0; pos < std::size(kTokens); ++pos) {
    if (kTokens[pos] == str) {
      return static_cast<Method>(pos);
    }
  }
  return std::nullopt;
}

}  // namespace decoy::http
