#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace decoy {

// Constraint over the number of calls an expectation received, checked at verification time only.
class CallCount {
 public:
  using Predicate = std::function<bool(uint64_t)>;

  enum class Kind : uint8_t { exactly, atLeast, atMost, between, satisfies };

  // Default constraint: at least once.
  CallCount() noexcept : CallCount(Kind::atLeast, 1, 0) {}

  [[nodiscard]] static CallCount Exactly(uint64_t count) noexcept { return {Kind::exactly, count, count}; }

  [[nodiscard]] static CallCount AtLeast(uint64_t count) noexcept { return {Kind::atLeast, count, 0}; }

  [[nodiscard]] static CallCount AtMost(uint64_t count) noexcept { return {Kind::atMost, 0, count}; }

  // Inclusive bounds. Throws std::invalid_argument if 'min' > 'max'.
  [[nodiscard]] static CallCount Between(uint64_t min, uint64_t max);

  [[nodiscard]] static CallCount Never() noexcept { return Exactly(0); }

  // Throws std::invalid_argument if 'predicate' is empty.
  [[nodiscard]] static CallCount Satisfies(Predicate predicate, std::string_view description);

  // Exceptions thrown by a Satisfies predicate propagate.
  [[nodiscard]] bool test(uint64_t actual) const;

  [[nodiscard]] std::string describe() const;

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  CallCount(Kind kind, uint64_t min, uint64_t max) noexcept : _min(min), _max(max), _kind(kind) {}

  uint64_t _min;
  uint64_t _max;
  Predicate _predicate;
  std::string _description;
  Kind _kind;
};

}  // namespace decoy
