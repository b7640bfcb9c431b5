#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace proc {

using ProcessId = std::uint32_t;
using OpenFilesResult = std::expected<std::vector<std::string>, std::error_code>;

/**
 * @brief Per-platform process introspection used by wait_on_files.
 *
 * Every query may fail with a transient error (the process exited, access was
 * denied); callers treat such failures as empty results.
 */
class IProcessInspector {
public:
    virtual ~IProcessInspector() = default;

    // Whether `pid` names a live process. Errors mean the process cannot be queried.
    [[nodiscard]] virtual std::expected<bool, std::error_code> is_running(ProcessId pid) const = 0;

    // Children of `pid` and their children, transitively. Excludes `pid` itself.
    [[nodiscard]] virtual std::expected<std::vector<ProcessId>, std::error_code> descendants(ProcessId pid) const = 0;

    // Paths of regular files `pid` currently holds open.
    [[nodiscard]] virtual OpenFilesResult open_files(ProcessId pid) const = 0;

    // open_files for several processes. Backends that enumerate system-wide state
    // override this to take one snapshot for the whole batch.
    [[nodiscard]] virtual std::map<ProcessId, OpenFilesResult> open_files_of(const std::vector<ProcessId>& pids) const;
};

#if defined(__linux__)
class LinuxProcessInspector final : public IProcessInspector {
public:
    [[nodiscard]] std::expected<bool, std::error_code> is_running(ProcessId pid) const override;
    [[nodiscard]] std::expected<std::vector<ProcessId>, std::error_code> descendants(ProcessId pid) const override;
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> open_files(ProcessId pid) const override;
};
#elif defined(_WIN32)
class NtProcessInspector final : public IProcessInspector {
public:
    [[nodiscard]] std::expected<bool, std::error_code> is_running(ProcessId pid) const override;
    [[nodiscard]] std::expected<std::vector<ProcessId>, std::error_code> descendants(ProcessId pid) const override;
    [[nodiscard]] OpenFilesResult open_files(ProcessId pid) const override;
    // Reads the system handle table once for all of `pids`.
    [[nodiscard]] std::map<ProcessId, OpenFilesResult> open_files_of(const std::vector<ProcessId>& pids) const override;
};
#endif

// Inspector for the host platform. Platforms without one get an inspector that fails
// every query with not_supported, which makes waits succeed immediately.
[[nodiscard]] std::unique_ptr<IProcessInspector> make_platform_inspector();

} // namespace proc
