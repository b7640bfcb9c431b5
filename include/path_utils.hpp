#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace utils {

// Replaces a leading "~" with the user's home directory. Returns the input unchanged
// when no home directory is known.
[[nodiscard]] std::string expand_user(std::string_view path);

// Absolute, symlink-resolved form of `path`, case-folded on Windows.
// Components that do not exist are normalized lexically.
[[nodiscard]] std::string normalize_path(const std::filesystem::path& path);

[[nodiscard]] bool path_exists(const std::filesystem::path& path) noexcept;
[[nodiscard]] bool is_regular_file(const std::filesystem::path& path) noexcept;
[[nodiscard]] bool is_directory(const std::filesystem::path& path) noexcept;

} // namespace utils
