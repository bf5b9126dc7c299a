#pragma once

#include <string>
#include <string_view>

#include "httplike/features.hpp"

#ifdef HTTPLIKE_ENABLE_SPDLOG
#include <spdlog/version.h>
#endif

#ifndef HTTPLIKE_VERSION_STR
#error "HTTPLIKE_VERSION_STR must be defined via build system"
#endif

namespace httplike {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return HTTPLIKE_VERSION_STR; }

// Multiline description of the build:
//   httplike <version>
//     protocols: <families>
//     logging: <backend>
std::string fullVersionString();

}  // namespace httplike
