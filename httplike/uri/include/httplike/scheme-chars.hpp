#pragma once

#include <array>
#include <cstddef>

namespace httplike::uri {

// Schemes longer than this are rejected, which bounds their storage to a single byte length.
inline constexpr std::size_t kMaxSchemeLen = 64;

inline constexpr char kSchemeCharInvalid = '\0';
inline constexpr char kSchemeCharColon = ':';

// RFC 3986 §3.1: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
// Maps each byte to itself when it is a scheme char, to ':' for the delimiter and to '\0' otherwise.
inline constexpr std::array<char, 256> kSchemeChars = [] {
  std::array<char, 256> table{};
  for (char ch = 'A'; ch <= 'Z'; ++ch) {
    table[static_cast<unsigned char>(ch)] = ch;
  }
  for (char ch = 'a'; ch <= 'z'; ++ch) {
    table[static_cast<unsigned char>(ch)] = ch;
  }
  for (char ch = '0'; ch <= '9'; ++ch) {
    table[static_cast<unsigned char>(ch)] = ch;
  }
  table['+'] = '+';
  table['-'] = '-';
  table['.'] = '.';
  table[':'] = kSchemeCharColon;
  return table;
}();

constexpr char SchemeCharClass(char ch) noexcept { return kSchemeChars[static_cast<unsigned char>(ch)]; }

constexpr bool IsSchemeChar(char ch) noexcept {
  const char cls = SchemeCharClass(ch);
  return cls != kSchemeCharInvalid && cls != kSchemeCharColon;
}

}  // namespace httplike::uri
