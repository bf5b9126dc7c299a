#include "httplike/version.hpp"

#include <format>
#include <string>
#include <string_view>

#include "httplike/features.hpp"

namespace httplike {

std::string fullVersionString() {
  std::string protocols;
  const auto appendFamily = [&protocols](bool enabled, std::string_view name) {
    if (enabled) {
      if (!protocols.empty()) {
        protocols.append(", ");
      }
      protocols.append(name);
    }
  };
  appendFamily(httpEnabled(), "http");
  appendFamily(rtspEnabled(), "rtsp");
  appendFamily(sipEnabled(), "sip");
  if (protocols.empty()) {
    protocols = "none";
  }

#ifdef HTTPLIKE_ENABLE_SPDLOG
  const std::string logging =
      std::format("spdlog {}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
#else
  const std::string logging = "disabled";
#endif

  return std::format("httplike {}\n  protocols: {}\n  logging: {}", version(), protocols, logging);
}

}  // namespace httplike
