#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstring>
#include <exception>
#include <utility>

namespace decoy {

// Exception carrying its message in an inline, fixed size buffer.
// Messages longer than kMsgMaxLen are truncated and terminated by "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 95;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmtStr, Args&&... args) {
    const auto res = fmt::format_to_n(_data, kMsgMaxLen, fmtStr, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      std::memcpy(_data + kMsgMaxLen - 3, "...", 3);
      _data[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace decoy
