#include "process_inspector.hpp"

#include "nt.hpp"

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace proc {

namespace {

[[nodiscard]] std::error_code last_error_code() {
    return std::error_code(static_cast<int>(::GetLastError()), std::system_category());
}

} // namespace

std::expected<bool, std::error_code> NtProcessInspector::is_running(const ProcessId pid) const {
    const nt::UniqueHandle process(::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid)));
    if (!process) {
        if (::GetLastError() == ERROR_INVALID_PARAMETER) {
            return false;
        }
        return std::unexpected(last_error_code());
    }

    DWORD exit_code = 0;
    if (!::GetExitCodeProcess(process.get(), &exit_code)) {
        return std::unexpected(last_error_code());
    }
    return exit_code == STILL_ACTIVE;
}

std::expected<std::vector<ProcessId>, std::error_code> NtProcessInspector::descendants(const ProcessId pid) const {
    auto parents = nt::query_parent_pids();
    if (!parents) {
        return std::unexpected(parents.error());
    }

    std::unordered_map<ProcessId, std::vector<ProcessId>> children_by_parent;
    for (const auto& [child, parent] : *parents) {
        // The idle process reports itself as its own parent.
        if (child != parent) {
            children_by_parent[parent].push_back(child);
        }
    }

    std::vector<ProcessId> result;
    std::unordered_set<ProcessId> seen{pid};
    std::deque<ProcessId> pending{pid};
    while (!pending.empty()) {
        const ProcessId current = pending.front();
        pending.pop_front();

        const auto it = children_by_parent.find(current);
        if (it == children_by_parent.end()) {
            continue;
        }
        for (const ProcessId child : it->second) {
            // Parent pids are reused on Windows; ignore cycles they may create.
            if (seen.insert(child).second) {
                result.push_back(child);
                pending.push_back(child);
            }
        }
    }
    return result;
}

OpenFilesResult NtProcessInspector::open_files(const ProcessId pid) const {
    auto files = open_files_of({pid});
    return std::move(files.at(pid));
}

std::map<ProcessId, OpenFilesResult> NtProcessInspector::open_files_of(const std::vector<ProcessId>& pids) const {
    // Without SeDebugPrivilege handles of elevated processes cannot be duplicated.
    static const bool privileged = nt::enable_debug_privilege().has_value();
    (void)privileged;

    std::map<ProcessId, OpenFilesResult> result;
    const std::vector<DWORD> wanted(pids.begin(), pids.end());
    auto handles = nt::query_handles(wanted);
    if (!handles) {
        for (const ProcessId pid : pids) {
            result.insert_or_assign(pid, OpenFilesResult(std::unexpected(handles.error())));
        }
        return result;
    }

    for (const ProcessId pid : pids) {
        result.insert_or_assign(pid, std::vector<std::string>{});
    }

    for (const nt::RawHandle& handle : *handles) {
        const auto type = nt::query_object_type(handle);
        if (!type || *type != "File") {
            continue;
        }

        const auto name = nt::query_object_name(handle);
        if (!name || name->empty()) {
            continue;
        }

        if (auto path = nt::to_dos_path(*name)) {
            result.at(static_cast<ProcessId>(handle.processId))->push_back(std::move(*path));
        }
    }
    return result;
}

} // namespace proc
