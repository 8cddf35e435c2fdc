#include "decoy/response-description.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace decoy {

std::chrono::milliseconds StreamPlan::totalDelay() const noexcept {
  auto ret = initialDelay;
  for (const auto& chunk : chunks) {
    ret += chunk.delayAfter;
  }
  return ret;
}

std::string StreamPlan::body() const {
  std::size_t size = 0;
  for (const auto& chunk : chunks) {
    size += chunk.data.size();
  }
  std::string ret;
  ret.reserve(size);
  for (const auto& chunk : chunks) {
    ret.append(chunk.data);
  }
  return ret;
}

}  // namespace decoy
