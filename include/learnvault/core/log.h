#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include <chlog/chlog.hpp>

namespace learnvault::log {

// Thread-safe. Sets the process log level. LEARNVAULT_LOG_LEVEL, when set, overrides `level`;
// an unknown name logs a warning and falls back to info.
void Init(std::string_view level);

// Thread-safe; installs the console sink on first use.
chlog::logger& Get();

// "trace" .. "critical", "warning" as an alias of "warn", and "off". Empty for anything else.
std::optional<chlog::level> ParseLevel(std::string_view name);

template <class... Args>
inline void debug(std::format_string<Args...> fmt, Args&&... args) {
    Get().debug(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void info(std::format_string<Args...> fmt, Args&&... args) {
    Get().info(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(std::format_string<Args...> fmt, Args&&... args) {
    Get().warn(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void error(std::format_string<Args...> fmt, Args&&... args) {
    Get().error(fmt, std::forward<Args>(args)...);
}

} // namespace learnvault::log
