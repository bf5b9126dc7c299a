#pragma once

namespace httplike {

// Protocol families are chosen when configuring the build. Each one gates the known schemes and the
// version tags it contributes.

#ifdef HTTPLIKE_ENABLE_HTTP
constexpr bool httpEnabled() { return true; }
#else
constexpr bool httpEnabled() { return false; }
#endif

#ifdef HTTPLIKE_ENABLE_RTSP
constexpr bool rtspEnabled() { return true; }
#else
constexpr bool rtspEnabled() { return false; }
#endif

#ifdef HTTPLIKE_ENABLE_SIP
constexpr bool sipEnabled() { return true; }
#else
constexpr bool sipEnabled() { return false; }
#endif

#ifdef HTTPLIKE_ENABLE_SPDLOG
constexpr bool spdLogEnabled() { return true; }
#else
constexpr bool spdLogEnabled() { return false; }
#endif

}  // namespace httplike
