#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace httplike {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char *pLhs = lhs.data();
  const char *pRhs = rhs.data();
  const char *end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

// Compares the first prefix.size() chars of value with prefix, ignoring ASCII case.
constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Mixes v into seed (boost::hash_combine flavour, 64-bit golden ratio).
constexpr std::size_t HashCombine(std::size_t seed, std::size_t v) noexcept {
  return seed ^ (v + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6) + (seed >> 2));
}

// Case-insensitive hash of str. The length is mixed in first so that
// equal-prefix inputs of different lengths do not trivially collide.
constexpr std::size_t CaseInsensitiveHash(std::string_view str) noexcept {
  std::size_t hash = HashCombine(0, str.size());
  for (char ch : str) {
    hash = HashCombine(hash, static_cast<std::size_t>(static_cast<unsigned char>(tolower(ch))));
  }
  return hash;
}

}  // namespace httplike
