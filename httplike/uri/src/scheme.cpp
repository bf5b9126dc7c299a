#include "httplike/scheme.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "httplike/ascii-case.hpp"
#include "httplike/known-protocol.hpp"
#include "httplike/log.hpp"
#include "httplike/scheme-boundary.hpp"
#include "httplike/scheme-chars.hpp"
#include "httplike/uri-error.hpp"

namespace httplike::uri {

namespace {

// Checks the generic scheme grammar: length bounds and scheme chars only.
std::optional<UriError> CheckGenericScheme(std::string_view str) {
  if (str.size() > kMaxSchemeLen) {
    log::debug("Scheme of {} bytes exceeds the maximum of {}", str.size(), kMaxSchemeLen);
    return UriError::SchemeTooLong;
  }
  if (str.empty()) {
    return UriError::InvalidScheme;
  }
  for (char ch : str) {
    // ':' is rejected as well, "http://" is not a scheme.
    if (!IsSchemeChar(ch)) {
      log::debug("Invalid scheme char 0x{:02x} in '{}'", static_cast<unsigned char>(ch), str);
      return UriError::InvalidScheme;
    }
  }
  return std::nullopt;
}

}  // namespace

Scheme::Scheme(std::string_view str) : Scheme(ParseSchemeExact(str).valueOrThrow()) {}

Scheme Scheme::FromValidatedText(std::string_view text) {
  if (const auto protocol = FindProtocolIgnoreCase(text)) {
    return Scheme(*protocol);
  }
  auto data = std::make_shared_for_overwrite<char[]>(text.size());
  text.copy(data.get(), text.size());
  return {std::move(data), text.size()};
}

Scheme Scheme::FromValidatedSlice(std::shared_ptr<const std::string> buffer, std::size_t size) {
  const std::string_view text(buffer->data(), size);
  if (const auto protocol = FindProtocolIgnoreCase(text)) {
    return Scheme(*protocol);
  }
  // Aliasing constructor: shares ownership of the whole buffer, points to its first byte.
  std::shared_ptr<const char[]> data(std::move(buffer), text.data());
  return {std::move(data), size};
}

Scheme Scheme::FromBoundary(std::string_view uri, SchemeBoundary boundary) {
  switch (boundary.kind()) {
    case SchemeBoundary::Kind::Standard:
      return Scheme(boundary.protocol());
    case SchemeBoundary::Kind::Other:
      if (boundary.schemeLength() > uri.size()) {
        throw InvalidUri(UriError::InvalidScheme);
      }
      return ParseSchemeExact(boundary.schemeText(uri)).valueOrThrow();
    case SchemeBoundary::Kind::Error:
      throw InvalidUri(boundary.error());
    default:
      throw InvalidUri(UriError::InvalidScheme);
  }
}

Scheme Scheme::FromSharedBuffer(std::shared_ptr<const std::string> buffer, SchemeBoundary boundary) {
  switch (boundary.kind()) {
    case SchemeBoundary::Kind::Standard:
      return Scheme(boundary.protocol());
    case SchemeBoundary::Kind::Other: {
      if (!buffer || boundary.schemeLength() > buffer->size()) {
        throw InvalidUri(UriError::InvalidScheme);
      }
      if (const auto err = CheckGenericScheme(boundary.schemeText(*buffer))) {
        throw InvalidUri(*err);
      }
      const std::size_t size = boundary.schemeLength();
      return FromValidatedSlice(std::move(buffer), size);
    }
    case SchemeBoundary::Kind::Error:
      throw InvalidUri(boundary.error());
    default:
      throw InvalidUri(UriError::InvalidScheme);
  }
}

std::string_view Scheme::str() const noexcept {
  switch (_kind) {
    case Kind::Standard:
      return ProtocolName(_protocol);
    case Kind::Other:
      return {_data.get(), _size};
    default:
      // Placeholder of a failed parse, or moved-from scheme.
      return {};
  }
}

std::size_t Scheme::hash() const noexcept {
  switch (_kind) {
    case Kind::Standard:
      return HashCombine(0, ProtocolHashTag(_protocol));
    case Kind::Other:
      return CaseInsensitiveHash(str());
    default:
      return 0;
  }
}

bool Scheme::operator==(const Scheme &rhs) const noexcept {
  if (_kind != rhs._kind) {
    // Known protocols are always canonicalized, an other scheme never spells one.
    return false;
  }
  if (_kind == Kind::Standard) {
    return _protocol == rhs._protocol;
  }
  // Two empty schemes both have an empty str().
  return CaseInsensitiveEqual(str(), rhs.str());
}

bool Scheme::operator==(std::string_view rhs) const noexcept { return CaseInsensitiveEqual(str(), rhs); }

Scheme SchemeParseResult::valueOrThrow() && {
  if (_hasError) {
    throw InvalidUri(_error);
  }
  return std::move(_scheme);
}

SchemeParseResult ParseSchemeExact(std::string_view str) {
  if (const auto protocol = FindProtocol(str)) {
    return SchemeParseResult(Scheme(*protocol));
  }
  if (const auto err = CheckGenericScheme(str)) {
    return SchemeParseResult(*err);
  }
  return SchemeParseResult(Scheme::FromValidatedText(str));
}

}  // namespace httplike::uri
