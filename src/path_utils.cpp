#include "path_utils.hpp"

#include "string_utils.hpp"

#include <cstdlib>
#include <system_error>

namespace utils {

namespace {

[[nodiscard]] const char* home_directory() noexcept {
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) {
        return profile;
    }
#endif
    const char* home = std::getenv("HOME");
    return (home && *home) ? home : nullptr;
}

[[nodiscard]] bool is_separator(const char ch) noexcept {
#ifdef _WIN32
    return ch == '/' || ch == '\\';
#else
    return ch == '/';
#endif
}

} // namespace

std::string expand_user(const std::string_view path) {
    if (path.empty() || path.front() != '~') {
        return std::string(path);
    }

    // "~user" forms are left alone.
    if (path.size() > 1 && !is_separator(path[1])) {
        return std::string(path);
    }

    const char* home = home_directory();
    if (!home) {
        return std::string(path);
    }

    std::string expanded(home);
    expanded.append(path.substr(1));
    return expanded;
}

std::string normalize_path(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    std::filesystem::path resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }

#ifdef _WIN32
    return to_lower_ascii(resolved.make_preferred().string());
#else
    return resolved.string();
#endif
}

bool path_exists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool is_regular_file(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool is_directory(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

} // namespace utils
