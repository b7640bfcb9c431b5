#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace env {

// Child-process environment, variable name to value.
using Environment = std::map<std::string, std::string>;
// std::nullopt removes the variable, any other value replaces it.
using Overrides = std::map<std::string, std::optional<std::string>>;

// A variable assigned while preparing the environment.
struct Toggle {
    std::string_view name;
    std::string_view value;
    // When false the value is only set if the variable is absent.
    bool forced;
};

// A default sanitizer option.
struct SanitizerDefault {
    std::string_view option;
    std::string_view value;
    bool forced;
};

inline constexpr Toggle kBrowserToggles[] = {
    {"G_SLICE", "always-malloc", true},
    {"MOZ_CC_RUN_DURING_SHUTDOWN", "1", true},
    {"MOZ_CRASHREPORTER", "1", true},
    {"MOZ_CRASHREPORTER_NO_REPORT", "1", true},
    {"MOZ_DISABLE_CONTENT_SANDBOX", "1", true},
    {"MOZ_DISABLE_GMP_SANDBOX", "1", true},
    {"MOZ_DISABLE_GPU_SANDBOX", "1", true},
    {"MOZ_DISABLE_NPAPI_SANDBOX", "1", true},
    {"MOZ_GDB_SLEEP", "0", true},
    {"XRE_NO_WINDOWS_CRASH_DIALOG", "1", true},
    {"XPCOM_DEBUG_BREAK", "warn", true},
    // Skia assertions are easily hit and mostly due to precision.
    {"MOZ_SKIA_DISABLE_ASSERTS", "1", false},
    {"RUST_BACKTRACE", "full", false},
};

inline constexpr SanitizerDefault kAsanDefaults[] = {
    {"abort_on_error", "true", false},
    {"allocator_may_return_null", "true", false},
    {"check_initialization_order", "true", false},
    {"detect_leaks", "false", false},
    {"disable_coredump", "true", false},
    {"sleep_before_dying", "0", false},
    {"strict_init_order", "true", false},
    {"symbolize", "true", false},
};

inline constexpr SanitizerDefault kLsanDefaults[] = {
    {"max_leaks", "1", false},
    {"print_suppressions", "false", false},
};

inline constexpr SanitizerDefault kUbsanDefaults[] = {
    {"print_stacktrace", "1", false},
};

inline constexpr std::string_view kAsanOptions = "ASAN_OPTIONS";
inline constexpr std::string_view kLsanOptions = "LSAN_OPTIONS";
inline constexpr std::string_view kUbsanOptions = "UBSAN_OPTIONS";
inline constexpr std::string_view kSymbolizerPath = "ASAN_SYMBOLIZER_PATH";

#ifdef _WIN32
inline constexpr std::string_view kSymbolizerBinary = "llvm-symbolizer.exe";
#else
inline constexpr std::string_view kSymbolizerBinary = "llvm-symbolizer";
#endif

/**
 * @brief Snapshot of the running process environment.
 */
[[nodiscard]] Environment current_environment();

/**
 * @brief Writes ASAN/LSAN/UBSAN option strings and resolves ASAN_SYMBOLIZER_PATH.
 * @return Errors from parsing existing option strings.
 */
std::expected<void, std::error_code> configure_sanitizers(Environment& environment,
                                                          const std::filesystem::path& target_dir,
                                                          std::string_view sanitizer_log);

/**
 * @brief Builds the environment used to launch the browser.
 * @param base Starting environment, usually current_environment().
 * @param target_dir Directory containing the browser binary.
 * @param sanitizer_log Prefix written to log_path in ASAN_OPTIONS and UBSAN_OPTIONS.
 * @param overrides Final additions, replacements and removals.
 */
[[nodiscard]] std::expected<Environment, std::error_code> prepare_environment(
    Environment base,
    const std::filesystem::path& target_dir,
    std::string_view sanitizer_log,
    const Overrides& overrides = {});

} // namespace env
