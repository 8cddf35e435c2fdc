#include "decoy/call-count.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace decoy {

namespace {

std::string_view Times(uint64_t count) { return count == 1 ? "time" : "times"; }

}  // namespace

CallCount CallCount::Between(uint64_t min, uint64_t max) {
  if (min > max) {
    throw std::invalid_argument(fmt::format("Invalid call count range [{}, {}]", min, max));
  }
  return {Kind::between, min, max};
}

CallCount CallCount::Satisfies(Predicate predicate, std::string_view description) {
  if (!predicate) {
    throw std::invalid_argument("CallCount::Satisfies requires a predicate");
  }
  CallCount ret(Kind::satisfies, 0, 0);
  ret._predicate = std::move(predicate);
  ret._description = description;
  return ret;
}

bool CallCount::test(uint64_t actual) const {
  switch (_kind) {
    case Kind::exactly:
      return actual == _min;
    case Kind::atLeast:
      return actual >= _min;
    case Kind::atMost:
      return actual <= _max;
    case Kind::between:
      return _min <= actual && actual <= _max;
    case Kind::satisfies:
      return _predicate(actual);
    default:
      return false;
  }
}

std::string CallCount::describe() const {
  switch (_kind) {
    case Kind::exactly:
      return _min == 0 ? std::string("never") : fmt::format("exactly {} {}", _min, Times(_min));
    case Kind::atLeast:
      return fmt::format("at least {} {}", _min, Times(_min));
    case Kind::atMost:
      return fmt::format("at most {} {}", _max, Times(_max));
    case Kind::between:
      return fmt::format("between {} and {} times", _min, _max);
    case Kind::satisfies:
      return fmt::format("call count satisfies {}", _description);
    default:
      return "unknown";
  }
}

}  // namespace decoy
