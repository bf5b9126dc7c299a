#include "httplike/protocol-version.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>

#include "httplike/log.hpp"

namespace httplike {

std::optional<Version> ParseVersion(std::string_view str) {
  for (std::size_t idx = 0; idx < Version::kEntries.size(); ++idx) {
    if (Version::kEntries[idx].str == str) {
      return Version(static_cast<Version::Id>(static_cast<std::underlying_type_t<Version::Id>>(idx)));
    }
  }
  log::debug("Unknown protocol version '{}'", str);
  return std::nullopt;
}

}  // namespace httplike
