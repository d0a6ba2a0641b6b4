#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

namespace trustgate::common {

/// Fatal fault in the trust state: a store that cannot be read or written,
/// a record that no longer decodes, an unusable key. Logs, flushes every
/// sink and terminates.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace trustgate::common
