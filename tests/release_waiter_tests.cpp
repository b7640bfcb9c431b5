#include "release_waiter.hpp"

#include "log.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        ++failures;
    }
}

using FilesResult = std::expected<std::vector<std::string>, std::error_code>;

constexpr proc::ProcessId kRootPid = 100;
constexpr proc::ProcessId kChildPid = 101;

// Scripted process tree used in place of the platform backend.
class FakeInspector final : public proc::IProcessInspector {
public:
    std::expected<bool, std::error_code> running = true;
    std::expected<std::vector<proc::ProcessId>, std::error_code> children = std::vector<proc::ProcessId>{};
    std::unordered_map<proc::ProcessId, FilesResult> files;
    // Number of open_files(kRootPid) calls that still report files; negative means forever.
    int root_polls_until_release = -1;
    // Number of is_running calls after which the process reports it has exited.
    int exit_after_running_checks = -1;

    mutable int running_calls = 0;
    mutable int descendant_calls = 0;
    mutable int open_file_calls = 0;
    mutable int batch_calls = 0;

    [[nodiscard]] std::expected<bool, std::error_code> is_running(proc::ProcessId) const override {
        ++running_calls;
        if (exit_after_running_checks >= 0 && running_calls > exit_after_running_checks) {
            return false;
        }
        return running;
    }

    [[nodiscard]] std::expected<std::vector<proc::ProcessId>, std::error_code> descendants(proc::ProcessId) const override {
        ++descendant_calls;
        return children;
    }

    [[nodiscard]] FilesResult open_files(const proc::ProcessId pid) const override {
        ++open_file_calls;
        if (pid == kRootPid && root_polls_until_release >= 0) {
            if (m_root_polls >= root_polls_until_release) {
                return std::vector<std::string>{};
            }
            ++m_root_polls;
        }

        if (const auto it = files.find(pid); it != files.end()) {
            return it->second;
        }
        return std::vector<std::string>{};
    }

    [[nodiscard]] std::map<proc::ProcessId, FilesResult> open_files_of(
        const std::vector<proc::ProcessId>& pids) const override {
        ++batch_calls;
        return proc::IProcessInspector::open_files_of(pids);
    }

private:
    mutable int m_root_polls = 0;
};

struct TempFile {
    std::filesystem::path path;

    TempFile() {
        std::random_device seed;
        path = std::filesystem::temp_directory_path() / ("waiter_tests_" + std::to_string(seed()) + ".log");
        std::ofstream(path) << "log";
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

double seconds_since(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

proc::WaitOptions make_options(double poll, double timeout, bool recursive = true) {
    return proc::WaitOptions{
        .pollInterval = proc::Seconds(poll),
        .recursive = recursive,
        .timeout = proc::Seconds(timeout)
    };
}

void test_empty_file_list_returns_immediately() {
    FakeInspector inspector;
    const auto result = proc::wait_on_files(inspector, kRootPid, {}, make_options(0.1, 1.0));

    expect_true(result.has_value() && *result, "empty file list should succeed");
    expect_true(inspector.running_calls == 0, "empty file list should not query the process");
}

void test_missing_files_are_ignored() {
    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{"/nonexistent/harness/file.log"};

    const auto result = proc::wait_on_files(inspector, kRootPid, {"/nonexistent/harness/file.log"},
                                            make_options(0.1, 1.0));
    expect_true(result.has_value() && *result, "files that do not exist should not be waited on");
    expect_true(inspector.open_file_calls == 0, "no polling should happen without existing files");
}

void test_process_not_running() {
    const TempFile file;
    FakeInspector inspector;
    inspector.running = false;
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.1, 1.0));
    expect_true(result.has_value() && *result, "a process that is not running should succeed");
    expect_true(inspector.open_file_calls == 0, "a process that is not running should not be scanned");
}

void test_inaccessible_process_counts_as_released() {
    const TempFile file;
    FakeInspector inspector;
    inspector.running = std::unexpected(std::make_error_code(std::errc::permission_denied));
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.1, 1.0));
    expect_true(result.has_value() && *result, "an inaccessible process should be treated as released");
}

void test_unrelated_open_files_succeed_without_sleep() {
    const TempFile watched;
    const TempFile other;
    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{other.path.string()};

    const auto start = std::chrono::steady_clock::now();
    const auto result = proc::wait_on_files(inspector, kRootPid, {watched.path.string()}, make_options(1.0, 5.0));

    expect_true(result.has_value() && *result, "process holding other files should succeed");
    expect_true(seconds_since(start) < 0.5, "success should be reported before the first sleep");
    expect_true(inspector.open_file_calls == 1, "a single poll should be enough");
}

void test_never_released_times_out() {
    const TempFile file;
    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};

    std::ostringstream captured;
    logging::set_sink(&captured);
    logging::set_level(logging::Level::Debug);

    const auto start = std::chrono::steady_clock::now();
    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.1, 0.2));
    const double elapsed = seconds_since(start);

    logging::set_level(logging::Level::Info);
    logging::set_sink(nullptr);

    expect_true(result.has_value() && !*result, "a file that stays open should time out");
    expect_true(elapsed >= 0.2, "timeout should not be reported early");
    expect_true(elapsed < 0.5, "timeout should overrun by at most about one poll interval");
    expect_true(captured.str().find("Timeout waiting for:") != std::string::npos,
                "timeout should log the files still open");
}

void test_release_after_polls() {
    const TempFile file;
    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};
    inspector.root_polls_until_release = 2;

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.01, 5.0));
    expect_true(result.has_value() && *result, "files released during the wait should succeed");
    expect_true(inspector.open_file_calls == 3, "polling should stop on the first clean scan");
}

void test_process_exits_during_wait() {
    const TempFile file;
    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};
    inspector.exit_after_running_checks = 2;

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.01, 5.0));
    expect_true(result.has_value() && *result, "process exiting during the wait should succeed");
    expect_true(inspector.open_file_calls == 2, "no scan should happen after the process exits");
}

void test_descendant_holding_file() {
    const TempFile file;
    FakeInspector inspector;
    inspector.children = std::vector<proc::ProcessId>{kChildPid};
    inspector.files[kChildPid] = std::vector<std::string>{file.path.string()};

    const auto recursive = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.0, 0.0));
    expect_true(recursive.has_value() && !*recursive, "recursive wait should see files held by descendants");

    const auto shallow = proc::wait_on_files(inspector, kRootPid, {file.path.string()},
                                             make_options(0.0, 0.0, false));
    expect_true(shallow.has_value() && *shallow, "non-recursive wait should ignore descendants");
}

void test_enumeration_errors_are_tolerated() {
    const TempFile file;
    FakeInspector inspector;
    inspector.children = std::unexpected(std::make_error_code(std::errc::permission_denied));
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};

    const auto held = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.0, 0.0));
    expect_true(held.has_value() && !*held, "descendant errors should not hide files held by the root");

    FakeInspector failing_child;
    failing_child.children = std::vector<proc::ProcessId>{kChildPid};
    failing_child.files[kChildPid] = FilesResult(std::unexpected(std::make_error_code(std::errc::no_such_process)));

    const auto released = proc::wait_on_files(failing_child, kRootPid, {file.path.string()}, make_options(0.0, 0.0));
    expect_true(released.has_value() && *released, "a child that vanished should contribute no files");
}

void test_paths_are_normalized() {
    const TempFile file;
    const std::filesystem::path dotted = file.path.parent_path() / "." / file.path.filename();

    FakeInspector inspector;
    inspector.files[kRootPid] = std::vector<std::string>{dotted.string()};

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.0, 0.0));
    expect_true(result.has_value() && !*result, "equivalent spellings of a path should match");

    std::error_code ec;
    const std::filesystem::path link = file.path.string() + ".lnk";
    std::filesystem::create_symlink(file.path, link, ec);
    if (!ec) {
        const auto via_link = proc::wait_on_files(inspector, kRootPid, {link.string()}, make_options(0.0, 0.0));
        expect_true(via_link.has_value() && !*via_link, "symlinks in the watch list should resolve to their target");
        std::filesystem::remove(link, ec);
    }
}

void test_invalid_timing_is_rejected() {
    const TempFile file;
    FakeInspector inspector;

    std::ostringstream captured;
    logging::set_sink(&captured);

    const auto too_slow = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(1.0, 0.5));
    const auto negative_poll = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(-0.1, 1.0));
    const auto negative_timeout = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.0, -1.0));

    logging::set_sink(nullptr);

    expect_true(!too_slow.has_value() && too_slow.error() == std::errc::invalid_argument,
                "poll interval above timeout should be rejected");
    expect_true(!negative_poll.has_value(), "negative poll interval should be rejected");
    expect_true(!negative_timeout.has_value(), "negative timeout should be rejected");
    expect_true(inspector.running_calls == 0, "invalid parameters should be rejected before polling");
}

void test_process_tree_is_scanned_once_per_poll() {
    const TempFile file;
    FakeInspector inspector;
    inspector.children = std::vector<proc::ProcessId>{kChildPid, kChildPid + 1, kChildPid + 2};
    inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};
    inspector.root_polls_until_release = 3;

    const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.01, 5.0));
    expect_true(result.has_value() && *result, "files released by the tree should succeed");
    expect_true(inspector.batch_calls == 4, "each poll should request open files for the whole tree at once");
    expect_true(inspector.open_file_calls == 16, "each poll should cover the root and every descendant");
}

void test_huge_timeouts_do_not_expire() {
    const TempFile file;
    for (const double timeout : {1e11, std::numeric_limits<double>::infinity()}) {
        FakeInspector inspector;
        inspector.files[kRootPid] = std::vector<std::string>{file.path.string()};
        inspector.exit_after_running_checks = 5;

        const auto result = proc::wait_on_files(inspector, kRootPid, {file.path.string()}, make_options(0.01, timeout));
        expect_true(result.has_value() && *result, "a very large timeout should keep waiting until the process exits");
        expect_true(inspector.open_file_calls == 5, "a very large timeout should allow repeated polls");
    }
}

void test_deadline_and_sleep_are_clamped() {
    const auto now = proc::Clock::now();
    const double infinity = std::numeric_limits<double>::infinity();

    expect_true(proc::detail::deadline_after(now, proc::Seconds(infinity)) == proc::Clock::time_point::max(),
                "infinite timeout should have no deadline");
    expect_true(proc::detail::deadline_after(now, proc::Seconds(1e11)) == proc::Clock::time_point::max(),
                "timeouts beyond the clock range should have no deadline");
    expect_true(proc::detail::deadline_after(now, proc::Seconds(2.0)) == now + std::chrono::seconds(2),
                "ordinary timeouts should be added to now");

    const auto clamped = proc::detail::sleep_duration(proc::Seconds(infinity));
    expect_true(clamped > proc::Clock::duration::zero() && clamped < proc::Clock::duration::max(),
                "infinite poll interval should be clamped to a finite sleep");
    expect_true(proc::detail::sleep_duration(proc::Seconds(0.25)) == std::chrono::milliseconds(250),
                "ordinary poll intervals should be unchanged");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    expect_true(!proc::detail::valid_wait_options(make_options(0.1, nan)), "NaN timeout should be rejected");
    expect_true(!proc::detail::valid_wait_options(make_options(nan, 1.0)), "NaN poll interval should be rejected");
}

} // namespace

int main() {
    test_empty_file_list_returns_immediately();
    test_missing_files_are_ignored();
    test_process_not_running();
    test_inaccessible_process_counts_as_released();
    test_unrelated_open_files_succeed_without_sleep();
    test_never_released_times_out();
    test_release_after_polls();
    test_process_exits_during_wait();
    test_descendant_holding_file();
    test_enumeration_errors_are_tolerated();
    test_paths_are_normalized();
    test_invalid_timing_is_rejected();
    test_process_tree_is_scanned_once_per_poll();
    test_huge_timeouts_do_not_expire();
    test_deadline_and_sleep_are_clamped();

    if (failures == 0) {
        std::cout << "All release_waiter tests passed.\n";
        return EXIT_SUCCESS;
    }

    std::cerr << failures << " release_waiter test(s) failed.\n";
    return EXIT_FAILURE;
}
