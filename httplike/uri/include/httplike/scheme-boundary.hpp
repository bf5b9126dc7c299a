#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "httplike/known-protocol.hpp"
#include "httplike/scheme-chars.hpp"
#include "httplike/uri-error.hpp"

namespace httplike::uri {

// Length of the "://" delimiter following a scheme in a full URI.
inline constexpr std::size_t kSchemeDelimiterLen = 3;

// Outcome of scanning the beginning of a full URI for a "<scheme>://" prefix.
// Finding no scheme is not an error: the input is then a relative reference.
class SchemeBoundary {
 public:
  enum class Kind : std::uint8_t { NoScheme, Standard, Other, Error };

  static constexpr SchemeBoundary None() noexcept { return {}; }

  // len must be in [1, kMaxSchemeLen], otherwise the boundary is an error.
  static constexpr SchemeBoundary OtherLength(std::size_t len) noexcept {
    if (len == 0) {
      return SchemeBoundary(UriError::InvalidScheme);
    }
    if (len > kMaxSchemeLen) {
      return SchemeBoundary(UriError::SchemeTooLong);
    }
    SchemeBoundary ret;
    ret._kind = Kind::Other;
    ret._len = static_cast<std::uint8_t>(len);
    return ret;
  }

  constexpr explicit SchemeBoundary(Protocol protocol) noexcept
      : _kind(Kind::Standard), _protocol(protocol), _len(static_cast<std::uint8_t>(ProtocolNameLength(protocol))) {}

  constexpr explicit SchemeBoundary(UriError error) noexcept : _kind(Kind::Error), _error(error) {}

  [[nodiscard]] constexpr Kind kind() const noexcept { return _kind; }

  [[nodiscard]] constexpr bool hasError() const noexcept { return _kind == Kind::Error; }

  // True for Standard and Other.
  [[nodiscard]] constexpr bool hasScheme() const noexcept { return _kind == Kind::Standard || _kind == Kind::Other; }

  [[nodiscard]] constexpr Protocol protocol() const noexcept {
    assert(_kind == Kind::Standard);
    return _protocol;
  }

  [[nodiscard]] constexpr UriError error() const noexcept {
    assert(_kind == Kind::Error);
    return _error;
  }

  // Number of bytes of the scheme itself, without the "://" delimiter.
  [[nodiscard]] constexpr std::size_t schemeLength() const noexcept {
    assert(hasScheme());
    return _len;
  }

  // Position of the first byte after "<scheme>://", where the authority starts.
  [[nodiscard]] constexpr std::size_t remainderPos() const noexcept { return schemeLength() + kSchemeDelimiterLen; }

  [[nodiscard]] constexpr std::string_view schemeText(std::string_view uri) const noexcept {
    return uri.substr(0, schemeLength());
  }

  constexpr bool operator==(const SchemeBoundary &) const noexcept = default;

 private:
  constexpr SchemeBoundary() noexcept = default;

  Kind _kind{Kind::NoScheme};
  Protocol _protocol{};
  UriError _error{};
  std::uint8_t _len{};
};

// Looks for a "<scheme>://" prefix at the start of uri.
// Known protocols are recognized case insensitively without scanning. Otherwise the scheme chars are
// scanned up to the first ':', which must be followed by "//". Any other byte, or a ':' not followed
// by "//", stops the scan with NoScheme.
// Only logging of rejected inputs may throw.
[[nodiscard]] SchemeBoundary ScanSchemePrefix(std::string_view uri);

}  // namespace httplike::uri
