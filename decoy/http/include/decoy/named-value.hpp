#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "decoy/vector.hpp"

namespace decoy {

// A name / value pair of a request facet (header, query parameter, cookie, form field).
struct NamedValue {
  std::string name;
  std::string value;

  bool operator==(const NamedValue&) const noexcept = default;
};

// Ordered list of name / value pairs. Duplicated names are kept in their original order.
using NamedValues = vector<NamedValue>;

// Returns the value of the first entry named 'name', or std::nullopt.
[[nodiscard]] std::optional<std::string_view> FindFirstValue(const NamedValues& values, std::string_view name,
                                                             bool caseInsensitiveName = false) noexcept;

// Returns the values of all entries named 'name', in order.
[[nodiscard]] vector<std::string_view> FindAllValues(const NamedValues& values, std::string_view name,
                                                     bool caseInsensitiveName = false);

}  // namespace decoy
