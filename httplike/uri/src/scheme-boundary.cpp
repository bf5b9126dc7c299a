#include "httplike/scheme-boundary.hpp"

#include <cstddef>
#include <string_view>

#include "httplike/ascii-case.hpp"
#include "httplike/config.hpp"
#include "httplike/known-protocol.hpp"
#include "httplike/log.hpp"
#include "httplike/scheme-chars.hpp"
#include "httplike/uri-error.hpp"

namespace httplike::uri {

namespace {
constexpr std::string_view kSchemeDelimiter = "://";
}  // namespace

SchemeBoundary ScanSchemePrefix(std::string_view uri) {
  // Fast path for "http://", "https://" and friends, which cover most inputs.
  for (const KnownProtocol &known : kKnownProtocols) {
    if (uri.size() >= known.name.size() + kSchemeDelimiterLen && StartsWithCaseInsensitive(uri, known.name) &&
        uri.substr(known.name.size()).starts_with(kSchemeDelimiter)) {
      return SchemeBoundary(known.protocol);
    }
  }

  if (uri.size() <= kSchemeDelimiterLen) {
    return SchemeBoundary::None();
  }

  for (std::size_t pos = 0; pos < uri.size(); ++pos) {
    switch (SchemeCharClass(uri[pos])) {
      case kSchemeCharColon:
        // A ':' not followed by "//" ends the search, even if another ':' comes later.
        if (!uri.substr(pos + 1).starts_with("//")) {
          return SchemeBoundary::None();
        }
        if (HTTPLIKE_UNLIKELY(pos > kMaxSchemeLen)) {
          log::debug("Scheme of {} bytes exceeds the maximum of {}", pos, kMaxSchemeLen);
          return SchemeBoundary(UriError::SchemeTooLong);
        }
        // "://" at the very start is an error, not a zero length scheme: schemes keep 1 to kMaxSchemeLen bytes.
        if (HTTPLIKE_UNLIKELY(pos == 0)) {
          log::debug("Empty scheme before '://'");
          return SchemeBoundary(UriError::InvalidScheme);
        }
        return SchemeBoundary::OtherLength(pos);
      case kSchemeCharInvalid:
        return SchemeBoundary::None();
      default:
        break;
    }
  }

  return SchemeBoundary::None();
}

}  // namespace httplike::uri
