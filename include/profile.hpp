#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace profile {

// Inputs for a new browser profile directory.
struct ProfileOptions {
    // prefs.js to install.
    std::optional<std::filesystem::path> prefsJs;
    // Existing profile directory to start from.
    std::optional<std::filesystem::path> templateDir;
    // .xpi packages, copied into the profile's extensions directory, or unpacked
    // extension directories, copied to extensions/<id> using the id from
    // manifest.json (applications.gecko.id) or install.rdf (em:id).
    std::vector<std::filesystem::path> extensions;
};

namespace detail {
    std::optional<std::string> read_manifest_json_id(const std::filesystem::path& manifest);
    std::optional<std::string> read_install_rdf_id(const std::filesystem::path& manifest);
    // manifest.json wins over install.rdf when both exist.
    std::optional<std::string> read_extension_id(const std::filesystem::path& extension_dir);
}

/**
 * @brief Creates a profile directory under the system temp directory.
 * @return Path of the new profile. On failure nothing is left on disk.
 */
[[nodiscard]] std::expected<std::filesystem::path, std::error_code> create_profile(const ProfileOptions& options = {});

/**
 * @brief Checks that every user_pref() from `input_prefs` is set in `profile_prefs`.
 *
 * Pref lines are compared up to the first comma, so both files must use the
 * formatting the browser writes.
 *
 * @return true when all prefs are present, no_such_file_or_directory when a file is missing.
 */
[[nodiscard]] std::expected<bool, std::error_code> check_prefs(const std::filesystem::path& profile_prefs,
                                                               const std::filesystem::path& input_prefs);

// Removes a directory tree, restoring owner write access and retrying once when an
// entry is read-only.
std::expected<void, std::error_code> remove_tree(const std::filesystem::path& path);

} // namespace profile
