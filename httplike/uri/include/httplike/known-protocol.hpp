#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "httplike/ascii-case.hpp"
#include "httplike/features.hpp"

namespace httplike::uri {

// Schemes with a dedicated, allocation free representation.
// The member set depends on the protocol families enabled in the build.
enum class Protocol : std::uint8_t {
#ifdef HTTPLIKE_ENABLE_HTTP
  http,
  https,
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
  rtsp,
  rtsps,
#endif
};

struct KnownProtocol {
  Protocol protocol;
  std::string_view name;  // canonical lower case spelling
  std::uint8_t hashTag;   // stable whatever the enabled families
};

inline constexpr std::size_t kNbKnownProtocols = (httpEnabled() ? 2U : 0U) + (rtspEnabled() ? 2U : 0U);

// Same order as the Protocol enumerators, so that it can be indexed by them.
inline constexpr std::array<KnownProtocol, kNbKnownProtocols> kKnownProtocols{{
#ifdef HTTPLIKE_ENABLE_HTTP
    {Protocol::http, "http", 1},
    {Protocol::https, "https", 2},
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
    {Protocol::rtsp, "rtsp", 3},
    {Protocol::rtsps, "rtsps", 4},
#endif
}};

constexpr const KnownProtocol &GetKnownProtocol(Protocol protocol) {
  return kKnownProtocols[static_cast<std::underlying_type_t<Protocol>>(protocol)];
}

constexpr std::string_view ProtocolName(Protocol protocol) { return GetKnownProtocol(protocol).name; }

constexpr std::size_t ProtocolNameLength(Protocol protocol) { return ProtocolName(protocol).size(); }

constexpr std::uint8_t ProtocolHashTag(Protocol protocol) { return GetKnownProtocol(protocol).hashTag; }

// Exact, case sensitive match against the canonical spellings.
constexpr std::optional<Protocol> FindProtocol(std::string_view str) {
  for (const KnownProtocol &known : kKnownProtocols) {
    if (known.name == str) {
      return known.protocol;
    }
  }
  return std::nullopt;
}

constexpr std::optional<Protocol> FindProtocolIgnoreCase(std::string_view str) {
  for (const KnownProtocol &known : kKnownProtocols) {
    if (CaseInsensitiveEqual(known.name, str)) {
      return known.protocol;
    }
  }
  return std::nullopt;
}

}  // namespace httplike::uri
