#pragma once

#include <amc/vector.hpp>

namespace decoy {

template <class T>
using vector = amc::vector<T>;

}  // namespace decoy
