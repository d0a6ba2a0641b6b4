#pragma once

#include <string>
#include <string_view>

namespace trustgate::common {

/// First 16 characters of a key or hash for log lines.
inline std::string short_key(const std::string_view value) {
  if (value.size() <= 16) {
    return std::string{value};
  }
  return std::string{value.substr(0, 16)} + "...";
}

}  // namespace trustgate::common
