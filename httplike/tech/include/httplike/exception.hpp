#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <exception>
#include <format>
#include <string_view>
#include <utility>

namespace httplike {

// Exception with inline message storage, so that it never allocates once built.
// Formatted messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::copy_n(str, N, _msg.data());
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args &&...args) {
    const auto res = std::format_to_n(_msg.data(), kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (std::cmp_less_equal(res.size, kMsgMaxLen)) {
      *res.out = '\0';
    } else {
      static constexpr std::string_view kEllipsis = "...";
      std::ranges::copy(kEllipsis, _msg.data() + kMsgMaxLen - kEllipsis.size());
      _msg[kMsgMaxLen] = '\0';
    }
  }

  [[nodiscard]] const char *what() const noexcept override { return _msg.data(); }

 private:
  std::array<char, kMsgMaxLen + 1> _msg;
};

}  // namespace httplike
