#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/named-value.hpp"
#include "decoy/vector.hpp"

namespace decoy {

// Predicate over the value(s) of one named entry of a request facet (a header, a query parameter, a cookie).
class ValueMatcher {
 public:
  using Predicate = std::function<bool(std::string_view)>;

  enum class Kind : uint8_t { equals, equalsIgnoreCase, satisfies, absent, present };

  // Passes if one of the values is exactly 'expected'.
  [[nodiscard]] static ValueMatcher Equals(std::string_view expected);

  // Passes if one of the values is equal to 'expected', ignoring ASCII case.
  [[nodiscard]] static ValueMatcher EqualsIgnoreCase(std::string_view expected);

  // Passes if 'predicate' returns true for one of the values.
  // Throws std::invalid_argument if 'predicate' is empty.
  [[nodiscard]] static ValueMatcher Satisfies(Predicate predicate, std::string_view description);

  // Passes if the entry is not present at all.
  [[nodiscard]] static ValueMatcher Absent();

  // Passes if the entry is present, whatever its value.
  [[nodiscard]] static ValueMatcher Present();

  // Tests the values of an entry (empty if the entry is absent). Exceptions thrown by a predicate propagate.
  [[nodiscard]] bool test(std::span<const std::string_view> values) const;

  [[nodiscard]] bool test(std::optional<std::string_view> value) const;

  [[nodiscard]] std::string describe() const;

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  ValueMatcher(Kind kind, std::string operand, Predicate predicate = {})
      : _operand(std::move(operand)), _predicate(std::move(predicate)), _kind(kind) {}

  [[nodiscard]] bool testOne(std::string_view value) const;

  std::string _operand;
  Predicate _predicate;
  Kind _kind;
};

// Predicate over all entries of a request facet.
class EntriesMatcher {
 public:
  using Predicate = std::function<bool(const NamedValues&)>;

  enum class Kind : uint8_t { containsAll, empty, satisfies };

  // Passes if every listed entry passes its value matcher. Other entries are ignored.
  [[nodiscard]] static EntriesMatcher ContainsAll(vector<std::pair<std::string, ValueMatcher>> entries);

  [[nodiscard]] static EntriesMatcher ContainsAll(std::initializer_list<std::pair<std::string, ValueMatcher>> entries);

  // Passes if the facet has no entry at all.
  [[nodiscard]] static EntriesMatcher Empty();

  // Throws std::invalid_argument if 'predicate' is empty.
  [[nodiscard]] static EntriesMatcher Satisfies(Predicate predicate, std::string_view description);

  [[nodiscard]] bool test(const NamedValues& entries, bool caseInsensitiveNames) const;

  [[nodiscard]] std::string describe() const;

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  EntriesMatcher(Kind kind, vector<std::pair<std::string, ValueMatcher>> entries, Predicate predicate,
                 std::string description)
      : _entries(std::move(entries)),
        _predicate(std::move(predicate)),
        _description(std::move(description)),
        _kind(kind) {}

  vector<std::pair<std::string, ValueMatcher>> _entries;
  Predicate _predicate;
  std::string _description;
  Kind _kind;
};

}  // namespace decoy
