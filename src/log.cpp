#include "log.hpp"

#include <atomic>
#include <iostream>

namespace logging {

namespace {

std::atomic<Level> g_level{Level::Info};
std::ostream* g_sink = nullptr;

[[nodiscard]] std::string_view prefix(const Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "Debug: ";
    case Level::Info:
        return "";
    case Level::Warning:
        return "Warning: ";
    case Level::Error:
        return "Error: ";
    }
    return "";
}

} // namespace

void set_level(const Level level) noexcept {
    g_level.store(level);
}

Level level() noexcept {
    return g_level.load();
}

void set_sink(std::ostream* sink) noexcept {
    g_sink = sink;
}

void write(const Level level, const std::string_view message) {
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << prefix(level) << message << '\n';
}

} // namespace logging
