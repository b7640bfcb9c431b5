#include "process_inspector.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <deque>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace proc {

namespace {

using DirPtr = std::unique_ptr<DIR, decltype(&::closedir)>;

[[nodiscard]] std::error_code errno_code() {
    return std::error_code(errno, std::generic_category());
}

[[nodiscard]] std::string proc_path(const ProcessId pid) {
    return "/proc/" + std::to_string(pid);
}

[[nodiscard]] std::optional<ProcessId> parse_pid(const std::string_view text) {
    ProcessId pid = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return pid;
}

// Reads the parent pid from /proc/<pid>/stat. The command name is enclosed in
// parentheses and may itself contain spaces or ')', so parse after the last ')'.
[[nodiscard]] std::optional<ProcessId> read_parent_pid(const ProcessId pid) {
    std::ifstream stat_file(proc_path(pid) + "/stat");
    if (!stat_file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << stat_file.rdbuf();
    const std::string content = buffer.str();

    const std::size_t name_end = content.rfind(')');
    if (name_end == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream fields(content.substr(name_end + 1));
    char state = 0;
    long long parent = -1;
    if (!(fields >> state >> parent) || parent < 0
        || parent > static_cast<long long>(std::numeric_limits<ProcessId>::max())) {
        return std::nullopt;
    }
    return static_cast<ProcessId>(parent);
}

[[nodiscard]] std::optional<std::string> read_link(const std::string& link) {
    std::string target(256, '\0');
    for (;;) {
        const ssize_t length = ::readlink(link.c_str(), target.data(), target.size());
        if (length < 0) {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < target.size()) {
            target.resize(static_cast<std::size_t>(length));
            return target;
        }
        target.resize(target.size() * 2);
    }
}

} // namespace

std::expected<bool, std::error_code> LinuxProcessInspector::is_running(const ProcessId pid) const {
    if (pid == 0) {
        return false;
    }

    struct stat info{};
    if (::stat(proc_path(pid).c_str(), &info) == 0) {
        return true;
    }

    if (errno == ENOENT || errno == ESRCH) {
        return false;
    }
    return std::unexpected(errno_code());
}

std::expected<std::vector<ProcessId>, std::error_code> LinuxProcessInspector::descendants(const ProcessId pid) const {
    DirPtr proc_dir(::opendir("/proc"), &::closedir);
    if (!proc_dir) {
        return std::unexpected(errno_code());
    }

    std::unordered_map<ProcessId, std::vector<ProcessId>> children_by_parent;
    bool found_root = false;
    while (const dirent* entry = ::readdir(proc_dir.get())) {
        const auto child = parse_pid(entry->d_name);
        if (!child) {
            continue;
        }
        if (*child == pid) {
            found_root = true;
            continue;
        }
        // Processes that exit during the scan simply drop out.
        if (const auto parent = read_parent_pid(*child)) {
            children_by_parent[*parent].push_back(*child);
        }
    }

    if (!found_root) {
        return std::unexpected(std::make_error_code(std::errc::no_such_process));
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
            if (seen.insert(child).second) {
                result.push_back(child);
                pending.push_back(child);
            }
        }
    }
    return result;
}

std::expected<std::vector<std::string>, std::error_code> LinuxProcessInspector::open_files(const ProcessId pid) const {
    const std::string fd_dir_path = proc_path(pid) + "/fd";
    DirPtr fd_dir(::opendir(fd_dir_path.c_str()), &::closedir);
    if (!fd_dir) {
        return std::unexpected(errno_code());
    }

    std::vector<std::string> files;
    while (const dirent* entry = ::readdir(fd_dir.get())) {
        if (!parse_pid(entry->d_name)) {
            continue;
        }

        const std::string link = fd_dir_path + "/" + entry->d_name;
        const auto target = read_link(link);
        // Sockets, pipes and anonymous inodes do not resolve to absolute paths.
        if (!target || target->empty() || target->front() != '/') {
            continue;
        }

        struct stat info{};
        if (::stat(link.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
            continue;
        }
        files.push_back(*target);
    }
    return files;
}

} // namespace proc
