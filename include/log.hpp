#pragma once

#include <fmt/format.h>

#include <ostream>
#include <string_view>
#include <utility>

namespace logging {

// Severity threshold; messages below the active level are dropped.
enum class Level { Debug, Info, Warning, Error };

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

// Redirects output (defaults to std::cerr). Passing nullptr restores std::cerr.
void set_sink(std::ostream* sink) noexcept;

void write(Level level, std::string_view message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Debug) {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Info) {
        write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) {
    if (level() <= Level::Warning) {
        write(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logging
