#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "httplike/known-protocol.hpp"
#include "httplike/scheme-boundary.hpp"
#include "httplike/uri-error.hpp"

namespace httplike::uri {

class SchemeParseResult;

// Scheme component of a URI (the "http" of "http://host/path").
//
// A Scheme is either one of the known protocols, stored as a simple tag, or any other valid scheme
// whose bytes are held in a read only buffer, possibly shared with the full URI it was scanned from.
// Failed parses and moves leave an empty Scheme behind, whose str() is empty.
// Comparison and hashing ignore ASCII case. Display keeps the original case of other schemes.
class Scheme {
 public:
  // Validates str as a standalone scheme. Throws InvalidUri on failure.
  explicit Scheme(std::string_view str);

  explicit Scheme(Protocol protocol) noexcept : _kind(Kind::Standard), _protocol(protocol) {}

  Scheme(const Scheme &) = default;
  Scheme &operator=(const Scheme &) = default;

  // A moved-from Scheme is empty: str() is "" and it only equals other moved-from schemes.
  Scheme(Scheme &&other) noexcept
      : _data(std::move(other._data)), _size(other._size), _kind(other._kind), _protocol(other._protocol) {
    other.reset();
  }

  Scheme &operator=(Scheme &&other) noexcept {
    if (this != &other) {
      _data = std::move(other._data);
      _size = other._size;
      _kind = other._kind;
      _protocol = other._protocol;
      other.reset();
    }
    return *this;
  }

  ~Scheme() = default;

  // Builds the scheme designated by boundary (as returned by ScanSchemePrefix(uri)) by copying it.
  // Throws InvalidUri if the boundary holds no scheme.
  static Scheme FromBoundary(std::string_view uri, SchemeBoundary boundary);

  // Same as FromBoundary, but other schemes reference the scheme bytes inside buffer instead of copying
  // them. buffer must not be modified afterwards; it is released with its last holder.
  static Scheme FromSharedBuffer(std::shared_ptr<const std::string> buffer, SchemeBoundary boundary);

  // Canonical text: lower case spelling for known protocols, stored bytes otherwise.
  [[nodiscard]] std::string_view str() const noexcept;

  [[nodiscard]] bool isStandard() const noexcept { return _kind == Kind::Standard; }

  [[nodiscard]] std::optional<Protocol> protocol() const noexcept {
    return isStandard() ? std::optional<Protocol>(_protocol) : std::nullopt;
  }

  [[nodiscard]] std::size_t hash() const noexcept;

  bool operator==(const Scheme &rhs) const noexcept;

  // Case-insensitive comparison with plain text.
  bool operator==(std::string_view rhs) const noexcept;

  friend std::ostream &operator<<(std::ostream &os, const Scheme &scheme) { return os << scheme.str(); }

 private:
  friend class SchemeParseResult;
  friend SchemeParseResult ParseSchemeExact(std::string_view str);

  enum class Kind : std::uint8_t { Empty, Standard, Other };

  // Empty scheme: placeholder of SchemeParseResult errors, and state left by moves.
  Scheme() noexcept = default;

  Scheme(std::shared_ptr<const char[]> data, std::size_t size) noexcept
      : _data(std::move(data)), _size(static_cast<std::uint8_t>(size)), _kind(Kind::Other) {}

  void reset() noexcept {
    _data.reset();
    _size = 0;
    _kind = Kind::Empty;
  }

  static Scheme FromValidatedText(std::string_view text);
  static Scheme FromValidatedSlice(std::shared_ptr<const std::string> buffer, std::size_t size);

  std::shared_ptr<const char[]> _data;
  std::uint8_t _size{};
  Kind _kind{Kind::Empty};
  Protocol _protocol{};
};

// Outcome of ParseSchemeExact: either a Scheme or a UriError.
class SchemeParseResult {
 public:
  explicit SchemeParseResult(Scheme scheme) noexcept : _scheme(std::move(scheme)) {}

  explicit SchemeParseResult(UriError error) noexcept : _error(error), _hasError(true) {}

  [[nodiscard]] bool hasError() const noexcept { return _hasError; }

  [[nodiscard]] UriError error() const noexcept {
    assert(_hasError);
    return _error;
  }

  [[nodiscard]] const Scheme &scheme() const & noexcept {
    assert(!_hasError);
    return _scheme;
  }

  [[nodiscard]] Scheme scheme() && noexcept {
    assert(!_hasError);
    return std::move(_scheme);
  }

  // Returns the scheme, or throws InvalidUri with the parse error.
  Scheme valueOrThrow() &&;

 private:
  Scheme _scheme;
  UriError _error{};
  bool _hasError{};
};

// Validates str as exactly one scheme, without any "://" nor remainder.
// Canonical lower case spellings of known protocols are recognized directly; any other input must be
// 1 to kMaxSchemeLen scheme chars. Spellings of known protocols in another case are canonicalized.
[[nodiscard]] SchemeParseResult ParseSchemeExact(std::string_view str);

}  // namespace httplike::uri

template <>
struct std::hash<httplike::uri::Scheme> {
  std::size_t operator()(const httplike::uri::Scheme &scheme) const noexcept { return scheme.hash(); }
};

template <>
struct std::formatter<httplike::uri::Scheme> : std::formatter<std::string_view> {
  auto format(const httplike::uri::Scheme &scheme, std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(scheme.str(), ctx);
  }
};
