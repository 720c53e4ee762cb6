#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace warden::common {

/// Log a fatal condition, flush every sink and terminate the process.
///
/// Reserved for broken setup (invalid operation specifications, storage that
/// cannot be opened). Anything a caller could react to is returned as a value.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace warden::common
