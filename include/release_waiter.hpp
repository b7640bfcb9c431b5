#pragma once

#include "process_inspector.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace proc {

using Seconds = std::chrono::duration<double>;
using Clock = std::chrono::steady_clock;

// Polling parameters for wait_on_files.
struct WaitOptions {
    // Delay between polls. Must not exceed timeout.
    Seconds pollInterval{0.1};
    // Also scan children and grandchildren of the process.
    bool recursive = true;
    // Total time to poll. Infinity waits without a deadline.
    Seconds timeout{60.0};
};

/**
 * @brief Waits until `pid` (and its descendants when recursive) no longer holds any of
 *        `files` open.
 *
 * Files that do not exist are ignored. A process that is gone or cannot be queried
 * counts as having released everything.
 *
 * @return true when the files were released (or nothing was left to wait for), false
 *         when the timeout elapsed first, invalid_argument for bad timing parameters.
 */
[[nodiscard]] std::expected<bool, std::error_code> wait_on_files(const IProcessInspector& inspector,
                                                                 ProcessId pid,
                                                                 const std::vector<std::string>& files,
                                                                 const WaitOptions& options = {});

// Same as above using make_platform_inspector().
[[nodiscard]] std::expected<bool, std::error_code> wait_on_files(ProcessId pid,
                                                                 const std::vector<std::string>& files,
                                                                 const WaitOptions& options = {});

namespace detail {
    [[nodiscard]] bool valid_wait_options(const WaitOptions& options) noexcept;
    // now + timeout, or time_point::max() for timeouts too large to represent.
    [[nodiscard]] Clock::time_point deadline_after(Clock::time_point now, Seconds timeout) noexcept;
    // Poll interval in clock ticks, clamped the same way.
    [[nodiscard]] Clock::duration sleep_duration(Seconds poll_interval) noexcept;
}

} // namespace proc
