#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>

#include "httplike/features.hpp"

namespace httplike {

// Protocol name and version pair, such as HTTP/1.1.
// The set of members is closed and fixed by the protocol families enabled in the build.
// Versions are ordered by declaration order, which is chronological within a protocol.
class Version {
 public:
  enum class Id : std::uint8_t {
#ifdef HTTPLIKE_ENABLE_HTTP
    Http09,
    Http10,
    Http11,
    H2,
    H3,
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
    Rtsp10,
#endif
#ifdef HTTPLIKE_ENABLE_SIP
    Sip20,
#endif
  };

  constexpr explicit Version(Id id) noexcept : _id(id) {}

  [[nodiscard]] constexpr Id id() const noexcept { return _id; }

  // Canonical text, e.g. "HTTP/1.1".
  [[nodiscard]] constexpr std::string_view str() const noexcept { return entry().str; }

  // Protocol part of the text, e.g. "HTTP".
  [[nodiscard]] constexpr std::string_view protocolName() const noexcept {
    return entry().str.substr(0, entry().str.find('/'));
  }

  [[nodiscard]] constexpr std::uint8_t major() const noexcept { return entry().major; }

  [[nodiscard]] constexpr std::uint8_t minor() const noexcept { return entry().minor; }

  constexpr auto operator<=>(const Version &) const noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, Version version) { return os << version.str(); }

 private:
  struct Entry {
    std::string_view str;
    std::uint8_t major;
    std::uint8_t minor;
  };

  static constexpr std::size_t kNbVersions =
      (httpEnabled() ? 5U : 0U) + (rtspEnabled() ? 1U : 0U) + (sipEnabled() ? 1U : 0U);

 public:
  // Same order as Id.
  static constexpr std::array<Entry, kNbVersions> kEntries{{
#ifdef HTTPLIKE_ENABLE_HTTP
      {"HTTP/0.9", 0, 9},
      {"HTTP/1.0", 1, 0},
      {"HTTP/1.1", 1, 1},
      {"HTTP/2.0", 2, 0},
      {"HTTP/3.0", 3, 0},
#endif
#ifdef HTTPLIKE_ENABLE_RTSP
      {"RTSP/1.0", 1, 0},
#endif
#ifdef HTTPLIKE_ENABLE_SIP
      {"SIP/2.0", 2, 0},
#endif
  }};

 private:
  [[nodiscard]] constexpr const Entry &entry() const noexcept {
    return kEntries[static_cast<std::underlying_type_t<Id>>(_id)];
  }

  Id _id;
};

#ifdef HTTPLIKE_ENABLE_HTTP
inline constexpr Version HTTP_0_9{Version::Id::Http09};
inline constexpr Version HTTP_1_0{Version::Id::Http10};
inline constexpr Version HTTP_1_1{Version::Id::Http11};
inline constexpr Version HTTP_2{Version::Id::H2};
inline constexpr Version HTTP_3{Version::Id::H3};
#endif

#ifdef HTTPLIKE_ENABLE_RTSP
inline constexpr Version RTSP_1_0{Version::Id::Rtsp10};
#endif

#ifdef HTTPLIKE_ENABLE_SIP
inline constexpr Version SIP_2_0{Version::Id::Sip20};
#endif

// Version used when nothing was negotiated. Only defined when at least one protocol family is enabled.
#if defined(HTTPLIKE_ENABLE_HTTP)
constexpr Version DefaultVersion() noexcept { return HTTP_1_1; }
#elif defined(HTTPLIKE_ENABLE_RTSP)
constexpr Version DefaultVersion() noexcept { return RTSP_1_0; }
#elif defined(HTTPLIKE_ENABLE_SIP)
constexpr Version DefaultVersion() noexcept { return SIP_2_0; }
#endif

// Parse a textual version token (e.g. "HTTP/1.1") among the enabled versions.
// RFC 9112 §2.3: the version token is case-sensitive.
std::optional<Version> ParseVersion(std::string_view str);

}  // namespace httplike

template <>
struct std::hash<httplike::Version> {
  std::size_t operator()(httplike::Version version) const noexcept {
    return std::hash<std::underlying_type_t<httplike::Version::Id>>{}(
        static_cast<std::underlying_type_t<httplike::Version::Id>>(version.id()));
  }
};

template <>
struct std::formatter<httplike::Version> : std::formatter<std::string_view> {
  auto format(httplike::Version version, std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(version.str(), ctx);
  }
};
