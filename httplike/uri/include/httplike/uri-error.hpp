#pragma once

#include <cstdint>
#include <string_view>

#include "httplike/exception.hpp"

namespace httplike::uri {

enum class UriError : std::uint8_t {
  InvalidScheme,  // empty, bad character or bare ':'
  SchemeTooLong,  // more than kMaxSchemeLen bytes
};

constexpr std::string_view UriErrorStr(UriError err) {
  switch (err) {
    case UriError::InvalidScheme:
      return "invalid scheme";
    case UriError::SchemeTooLong:
      return "scheme too long";
    default:
      return "unknown uri error";
  }
}

// Thrown by the throwing Scheme construction paths.
class InvalidUri : public exception {
 public:
  explicit InvalidUri(UriError err) : exception("invalid uri: {}", UriErrorStr(err)), _error(err) {}

  [[nodiscard]] UriError error() const noexcept { return _error; }

 private:
  UriError _error;
};

}  // namespace httplike::uri
