#include "decoy/named-value.hpp"

#include <optional>
#include <string_view>

#include "decoy/ascii.hpp"
#include "decoy/vector.hpp"

namespace decoy {

namespace {
bool NameEqual(std::string_view lhs, std::string_view rhs, bool caseInsensitiveName) {
  return caseInsensitiveName ? CaseInsensitiveEqual(lhs, rhs) : lhs == rhs;
}
}  // namespace

std::optional<std::string_view> FindFirstValue(const NamedValues& values, std::string_view name,
                                               bool caseInsensitiveName) noexcept {
  for (const auto& namedValue : values) {
    if (NameEqual(namedValue.name, name, caseInsensitiveName)) {
      return std::string_view(namedValue.value);
    }
  }
  return std::nullopt;
}

vector<std::string_view> FindAllValues(const NamedValues& values, std::string_view name, bool caseInsensitiveName) {
  vector<std::string_view> ret;
  for (const auto& namedValue : values) {
    if (NameEqual(namedValue.name, name, caseInsensitiveName)) {
      ret.emplace_back(namedValue.value);
    }
  }
  return ret;
}

}  // namespace decoy
