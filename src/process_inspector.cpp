#include "process_inspector.hpp"

namespace proc {

#if !defined(__linux__) && !defined(_WIN32)
namespace {

// Used where no introspection backend exists; every query reports not_supported.
class UnsupportedProcessInspector final : public IProcessInspector {
public:
    [[nodiscard]] std::expected<bool, std::error_code> is_running(ProcessId) const override {
        return std::unexpected(std::make_error_code(std::errc::not_supported));
    }

    [[nodiscard]] std::expected<std::vector<ProcessId>, std::error_code> descendants(ProcessId) const override {
        return std::unexpected(std::make_error_code(std::errc::not_supported));
    }

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> open_files(ProcessId) const override {
        return std::unexpected(std::make_error_code(std::errc::not_supported));
    }
};

} // namespace
#endif

std::map<ProcessId, OpenFilesResult> IProcessInspector::open_files_of(const std::vector<ProcessId>& pids) const {
    std::map<ProcessId, OpenFilesResult> result;
    for (const ProcessId pid : pids) {
        if (!result.contains(pid)) {
            result.emplace(pid, open_files(pid));
        }
    }
    return result;
}

std::unique_ptr<IProcessInspector> make_platform_inspector() {
#if defined(__linux__)
    return std::make_unique<LinuxProcessInspector>();
#elif defined(_WIN32)
    return std::make_unique<NtProcessInspector>();
#else
    return std::make_unique<UnsupportedProcessInspector>();
#endif
}

} // namespace proc
