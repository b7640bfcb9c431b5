#include "release_waiter.hpp"

#include "log.hpp"
#include "path_utils.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <set>
#include <thread>

namespace proc {

namespace {

// Longer durations are treated as unbounded. Kept well below the nanosecond range of
// the clock so that conversions from Seconds cannot overflow.
constexpr Seconds kMaxWait = std::chrono::hours(24 * 365 * 100);

// Normalized paths of every watched file held open by `pid` and, when recursive, its
// descendants. Enumeration failures contribute nothing.
[[nodiscard]] std::vector<std::string> held_files(const IProcessInspector& inspector,
                                                  const ProcessId pid,
                                                  const bool recursive,
                                                  const std::set<std::string>& watched) {
    std::vector<ProcessId> targets{pid};
    if (recursive) {
        if (auto children = inspector.descendants(pid); children) {
            targets.insert(targets.end(), children->begin(), children->end());
        } else {
            logging::debug("Cannot list descendants of {} ({})", pid, children.error().message());
        }
    }

    std::set<std::string> open_files;
    for (const auto& [target, files] : inspector.open_files_of(targets)) {
        if (!files) {
            logging::debug("Cannot list open files of {} ({})", target, files.error().message());
            continue;
        }
        for (const std::string& file : *files) {
            open_files.insert(utils::normalize_path(file));
        }
    }

    std::vector<std::string> held;
    for (const std::string& file : open_files) {
        if (watched.contains(file)) {
            held.push_back(file);
        }
    }
    return held;
}

} // namespace

namespace detail {

bool valid_wait_options(const WaitOptions& options) noexcept {
    return options.pollInterval.count() >= 0.0
        && options.timeout.count() >= 0.0
        && options.pollInterval <= options.timeout;
}

Clock::time_point deadline_after(const Clock::time_point now, const Seconds timeout) noexcept {
    if (!(timeout < kMaxWait)) {
        return Clock::time_point::max();
    }
    return now + std::chrono::duration_cast<Clock::duration>(timeout);
}

Clock::duration sleep_duration(const Seconds poll_interval) noexcept {
    return std::chrono::duration_cast<Clock::duration>(std::min(poll_interval, kMaxWait));
}

} // namespace detail

std::expected<bool, std::error_code> wait_on_files(const IProcessInspector& inspector,
                                                   const ProcessId pid,
                                                   const std::vector<std::string>& files,
                                                   const WaitOptions& options) {
    if (!detail::valid_wait_options(options)) {
        logging::error("Invalid wait parameters (poll interval {}s, timeout {}s)",
                       options.pollInterval.count(), options.timeout.count());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    const auto deadline = detail::deadline_after(Clock::now(), options.timeout);

    std::set<std::string> watched;
    for (const std::string& file : files) {
        if (utils::path_exists(file)) {
            watched.insert(utils::normalize_path(file));
        }
    }

    while (!watched.empty()) {
        // A process that is gone or no longer accessible has nothing left to release.
        // Access loss can also hide a file still held open; this is accepted.
        const auto running = inspector.is_running(pid);
        if (!running) {
            logging::debug("Process {} is not accessible ({}), not waiting", pid, running.error().message());
            break;
        }
        if (!*running) {
            break;
        }

        const std::vector<std::string> held = held_files(inspector, pid, options.recursive, watched);
        if (held.empty()) {
            break;
        }

        if (deadline <= Clock::now()) {
            logging::debug("Timeout waiting for: {}", utils::join(held, ", "));
            return false;
        }

        std::this_thread::sleep_for(detail::sleep_duration(options.pollInterval));
    }

    return true;
}

std::expected<bool, std::error_code> wait_on_files(const ProcessId pid,
                                                   const std::vector<std::string>& files,
                                                   const WaitOptions& options) {
    const auto inspector = make_platform_inspector();
    return wait_on_files(*inspector, pid, files, options);
}

} // namespace proc
