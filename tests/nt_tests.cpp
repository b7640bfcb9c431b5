#include "nt.hpp"
#include "process_inspector.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        ++failures;
    }
}

void test_grow_buffer_size_prefers_needed_plus_margin() {
    const std::size_t grown = nt::detail::grow_buffer_size(1'024, 4'096);
    expect_true(grown == 5'120,
                "grow_buffer_size should use needed + 25% margin when needed exceeds doubling");
}

void test_grow_buffer_size_clamps_on_overflow_risk() {
    const std::size_t near_max = static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) - 8;
    const std::size_t grown = nt::detail::grow_buffer_size(near_max, 16);

    expect_true(grown == static_cast<std::size_t>(std::numeric_limits<ULONG>::max()),
                "grow_buffer_size should clamp to ULONG max when growth overflows or exceeds limit");
}

void test_buffer_has_complete_payload_rejects_too_small_buffer() {
    expect_true(!nt::detail::buffer_has_complete_payload(1, 1),
                "buffer_has_complete_payload should reject buffers smaller than handle header");
}

void test_replace_device_prefix() {
    const std::vector<std::pair<std::string, std::string>> devices{
        {"\\Device\\HarddiskVolume1", "D:"},
        {"\\Device\\HarddiskVolume10", "C:"},
    };

    expect_true(nt::detail::replace_device_prefix("\\Device\\HarddiskVolume10\\Temp\\ffp.log", devices)
                    == "C:\\Temp\\ffp.log",
                "device prefix should map to the matching drive");
    expect_true(nt::detail::replace_device_prefix("\\device\\harddiskvolume1\\x", devices) == "D:\\x",
                "device prefix comparison should ignore case");
    expect_true(nt::detail::replace_device_prefix("\\Device\\Mup\\server\\share", devices)
                    == "\\Device\\Mup\\server\\share",
                "unknown devices should be left unchanged");
}

void test_dos_path_resolver_reloads_on_miss() {
    std::vector<nt::DeviceTable> tables{
        {{"\\Device\\HarddiskVolume1", "C:"}},
        {{"\\Device\\HarddiskVolume1", "C:"}, {"\\Device\\HarddiskVolume7", "E:"}},
    };
    std::size_t next = 0;
    nt::detail::DosPathResolver resolver(
        [&]() { return tables[std::min(next++, tables.size() - 1)]; },
        std::chrono::steady_clock::duration::zero());

    expect_true(resolver.resolve("\\Device\\HarddiskVolume1\\a.log") == "C:\\a.log",
                "known devices should resolve");
    expect_true(resolver.loads() == 1, "the first lookup should load the device table");

    expect_true(resolver.resolve("\\Device\\HarddiskVolume1\\b.log") == "C:\\b.log",
                "cached devices should resolve without reloading");
    expect_true(resolver.loads() == 1, "hits should not reload the device table");

    expect_true(resolver.resolve("\\Device\\HarddiskVolume7\\c.log") == "E:\\c.log",
                "a drive mounted after the first lookup should resolve");
    expect_true(resolver.loads() == 2, "a miss should reload the device table");
}

void test_dos_path_resolver_rate_limits_reloads() {
    std::size_t loads = 0;
    nt::detail::DosPathResolver resolver(
        [&]() {
            ++loads;
            return nt::DeviceTable{{"\\Device\\HarddiskVolume1", "C:"}};
        },
        std::chrono::hours(1));

    expect_true(!resolver.resolve("\\Device\\Mup\\server\\share").has_value(), "unknown devices should not resolve");
    expect_true(!resolver.resolve("\\Device\\Mup\\server\\share").has_value(), "unknown devices should not resolve");
    expect_true(loads == 1, "repeated misses within the refresh interval should not reload");
}

void test_open_files_of_matches_open_files() {
    const auto self = static_cast<proc::ProcessId>(::GetCurrentProcessId());
    const proc::NtProcessInspector inspector;

    const auto batch = inspector.open_files_of({self, 0});
    expect_true(batch.size() == 2, "open_files_of should report every requested process");
    expect_true(batch.contains(self), "open_files_of should report the current process");
}

void test_current_process_is_running() {
    const proc::NtProcessInspector inspector;
    const auto running = inspector.is_running(static_cast<proc::ProcessId>(::GetCurrentProcessId()));
    expect_true(running.has_value() && *running, "current process should be running");
}

void test_open_files_reports_held_file() {
    const auto path = std::filesystem::temp_directory_path() / "nt_tests_held.log";
    std::ofstream held(path);

    const proc::NtProcessInspector inspector;
    const auto files = inspector.open_files(static_cast<proc::ProcessId>(::GetCurrentProcessId()));
    if (!files) {
        expect_true(files.error().value() != 0, "open_files failure should include a non-zero error code");
        return;
    }

    const std::string wanted = std::filesystem::weakly_canonical(path).string();
    const bool found = std::any_of(files->begin(), files->end(), [&](const std::string& file) {
        return _stricmp(std::filesystem::weakly_canonical(file).string().c_str(), wanted.c_str()) == 0;
    });
    expect_true(found, "open_files should report a file held by the current process");

    held.close();
    std::filesystem::remove(path);
}

} // namespace

int main() {
    test_grow_buffer_size_prefers_needed_plus_margin();
    test_grow_buffer_size_clamps_on_overflow_risk();
    test_buffer_has_complete_payload_rejects_too_small_buffer();
    test_replace_device_prefix();
    test_dos_path_resolver_reloads_on_miss();
    test_dos_path_resolver_rate_limits_reloads();
    test_open_files_of_matches_open_files();
    test_current_process_is_running();
    test_open_files_reports_held_file();

    if (failures == 0) {
        std::cout << "All nt tests passed.\n";
        return EXIT_SUCCESS;
    }

    std::cerr << failures << " nt test(s) failed.\n";
    return EXIT_FAILURE;
}
