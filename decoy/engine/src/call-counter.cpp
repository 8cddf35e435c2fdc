#include "decoy/call-counter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace decoy {

void CallNotifier::notify() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    ++_generation;
  }
  _cv.notify_all();
}

uint64_t CallNotifier::generation() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _generation;
}

uint64_t CallNotifier::waitChange(uint64_t seenGeneration, std::chrono::steady_clock::duration maxWait) {
  std::unique_lock<std::mutex> lock(_mutex);
  _cv.wait_for(lock, maxWait, [this, seenGeneration] { return _generation != seenGeneration; });
  return _generation;
}

uint64_t CallCounter::increment() {
  const uint64_t callIndex = _count.fetch_add(1, std::memory_order_acq_rel) + 1;
  if (_notifier) {
    _notifier->notify();
  }
  return callIndex;
}

}  // namespace decoy
