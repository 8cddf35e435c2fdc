#include "decoy/value-matcher.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/ascii.hpp"
#include "decoy/named-value.hpp"
#include "decoy/vector.hpp"

namespace decoy {

ValueMatcher ValueMatcher::Equals(std::string_view expected) { return {Kind::equals, std::string(expected)}; }

ValueMatcher ValueMatcher::EqualsIgnoreCase(std::string_view expected) {
  return {Kind::equalsIgnoreCase, std::string(expected)};
}

ValueMatcher ValueMatcher::Satisfies(Predicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("ValueMatcher::Satisfies requires a predicate");
  }
  return {Kind::satisfies, std::string(description), std::move(predicate)};
}

ValueMatcher ValueMatcher::Absent() { return {Kind::absent, {}}; }

ValueMatcher ValueMatcher::Present() { return {Kind::present, {}}; }

bool ValueMatcher::testOne(std::string_view value) const {
  switch (_kind) {
    case Kind::equals:
      return value == _operand;
    case Kind::equalsIgnoreCase:
      return CaseInsensitiveEqual(value, _operand);
    case Kind::satisfies:
      return _predicate(value);
    default:
      return true;
  }
}

bool ValueMatcher::test(std::span<const std::string_view> values) const {
  switch (_kind) {
    case Kind::absent:
      return values.empty();
    case Kind::present:
      return !values.empty();
    default:
      return std::ranges::any_of(values, [this](std::string_view value) { return testOne(value); });
  }
}

bool ValueMatcher::test(std::optional<std::string_view> value) const {
  if (value) {
    return test(std::span<const std::string_view>(&*value, 1));
  }
  return test(std::span<const std::string_view>{});
}

std::string ValueMatcher::describe() const {
  switch (_kind) {
    case Kind::equals:
      return fmt::format("equals \"{}\"", _operand);
    case Kind::equalsIgnoreCase:
      return fmt::format("equals ignoring case \"{}\"", _operand);
    case Kind::satisfies:
      return fmt::format("satisfies {}", _operand);
    case Kind::absent:
      return "is absent";
    case Kind::present:
      return "is present";
    default:
      return "unknown";
  }
}

EntriesMatcher EntriesMatcher::ContainsAll(vector<std::pair<std::string, ValueMatcher>> entries) {
  return {Kind::containsAll, std::move(entries), {}, {}};
}

EntriesMatcher EntriesMatcher::ContainsAll(std::initializer_list<std::pair<std::string, ValueMatcher>> entries) {
  return ContainsAll(vector<std::pair<std::string, ValueMatcher>>(entries.begin(), entries.end()));
}

EntriesMatcher EntriesMatcher::Empty() { return {Kind::empty, {}, {}, {}}; }

EntriesMatcher EntriesMatcher::Satisfies(Predicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("EntriesMatcher::Satisfies requires a predicate");
  }
  return {Kind::satisfies, {}, std::move(predicate), std::string(description)};
}

bool EntriesMatcher::test(const NamedValues& entries, bool caseInsensitiveNames) const {
  switch (_kind) {
    case Kind::containsAll:
      return std::ranges::all_of(_entries, [&](const auto& nameAndMatcher) {
        const auto values = FindAllValues(entries, nameAndMatcher.first, caseInsensitiveNames);
        return nameAndMatcher.second.test(std::span<const std::string_view>(values.data(), values.size()));
      });
    case Kind::empty:
      return entries.empty();
    case Kind::satisfies:
      return _predicate(entries);
    default:
      return false;
  }
}

std::string EntriesMatcher::describe() const {
  switch (_kind) {
    case Kind::containsAll: {
      std::string ret("contains all of {");
      bool first = true;
      for (const auto& [name, matcher] : _entries) {
        if (!first) {
          ret.append(", ");
        }
        first = false;
        ret.append(name).append(" ").append(matcher.describe());
      }
      ret.push_back('}');
      return ret;
    }
    case Kind::empty:
      return "is empty";
    case Kind::satisfies:
      return fmt::format("satisfies {}", _description);
    default:
      return "unknown";
  }
}

}  // namespace decoy
