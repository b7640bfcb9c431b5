#include "nt.hpp"

#include "string_utils.hpp"

#include <tlhelp32.h>

#include <cstddef>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace nt {

using NtQuerySystemInformationPtr = NTSTATUS(NTAPI*)(
    SYSTEM_INFORMATION_CLASS SystemInformationClass,
    PVOID SystemInformation,
    ULONG SystemInformationLength,
    PULONG ReturnLength
);

using NtQueryObjectPtr = NTSTATUS(NTAPI*)(
    HANDLE Handle,
    OBJECT_INFORMATION_CLASS ObjectInformationClass,
    PVOID ObjectInformation,
    ULONG ObjectInformationLength,
    PULONG ReturnLength
);

namespace {

struct SYSTEM_HANDLE_TABLE_ENTRY_INFO_EX {
    PVOID Object;
    ULONG_PTR UniqueProcessId;
    ULONG_PTR HandleValue;
    ULONG GrantedAccess;
    USHORT CreatorBackTraceIndex;
    USHORT ObjectTypeIndex;
    ULONG HandleAttributes;
    ULONG Reserved;
};

struct SYSTEM_HANDLE_INFORMATION_EX {
    ULONG_PTR NumberOfHandles;
    ULONG_PTR Reserved;
    SYSTEM_HANDLE_TABLE_ENTRY_INFO_EX Handles[1];
};

struct OBJECT_TYPE_INFORMATION_HEAD {
    UNICODE_STRING TypeName;
};

struct OBJECT_NAME_INFORMATION_HEAD {
    UNICODE_STRING Name;
};

constexpr std::size_t kInitialBufferSize = 1u << 20; // 1 MiB
constexpr int kMaxRetries = 10;
constexpr ULONG kObjectTypeInformation = 2;
constexpr ULONG kObjectNameInformation = 1;

[[nodiscard]] std::error_code last_error_code() {
    return std::error_code(static_cast<int>(::GetLastError()), std::system_category());
}

[[nodiscard]] std::error_code ntstatus_error(NTSTATUS) {
    return std::make_error_code(std::errc::io_error);
}

[[nodiscard]] std::expected<std::string, Error> make_error(const std::errc errc) {
    return std::unexpected(std::make_error_code(errc));
}

template <typename Function>
[[nodiscard]] Function load_ntdll_export(const char* name) {
    HMODULE ntdll = ::GetModuleHandleW(L"ntdll.dll");
    if (!ntdll) {
        ntdll = ::LoadLibraryW(L"ntdll.dll");
    }

    if (!ntdll) {
        return nullptr;
    }

    FARPROC raw_proc = ::GetProcAddress(ntdll, name);
    Function ptr = nullptr;
    static_assert(sizeof(ptr) == sizeof(raw_proc));
    std::memcpy(&ptr, &raw_proc, sizeof(ptr));
    return ptr;
}

[[nodiscard]] bool looks_like_sync_pipe_file(const RawHandle& handle) {
    constexpr std::uint32_t pipe_mask = FILE_READ_DATA | FILE_WRITE_DATA | SYNCHRONIZE;
    return (handle.grantedAccess & pipe_mask) == pipe_mask;
}

[[nodiscard]] std::expected<UniqueHandle, Error> duplicate_to_current_process(const RawHandle& handle) {
    if (handle.processId == 0 || handle.handleValue == 0) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    if (handle.processId > static_cast<std::uintptr_t>(std::numeric_limits<DWORD>::max())) {
        return std::unexpected(std::make_error_code(std::errc::result_out_of_range));
    }

    const UniqueHandle source_process(
        ::OpenProcess(PROCESS_DUP_HANDLE, FALSE, static_cast<DWORD>(handle.processId)));
    if (!source_process) {
        return std::unexpected(last_error_code());
    }

    HANDLE duplicated = nullptr;
    const BOOL duplicated_ok = ::DuplicateHandle(
        source_process.get(),
        reinterpret_cast<HANDLE>(handle.handleValue),
        ::GetCurrentProcess(),
        &duplicated,
        0,
        FALSE,
        DUPLICATE_SAME_ACCESS
    );

    if (!duplicated_ok || !duplicated) {
        return std::unexpected(last_error_code());
    }

    return UniqueHandle(duplicated);
}

[[nodiscard]] std::expected<std::string, Error> query_unicode_information(
    NtQueryObjectPtr nt_query_object,
    HANDLE duplicated,
    const ULONG info_class
) {
    const auto object_class = static_cast<OBJECT_INFORMATION_CLASS>(info_class);
    ULONG needed_size = 0;
    NTSTATUS status = nt_query_object(duplicated, object_class, nullptr, 0, &needed_size);

    if (status != STATUS_INFO_LENGTH_MISMATCH && status != STATUS_SUCCESS) {
        return std::unexpected(ntstatus_error(status));
    }

    std::vector<std::byte> buffer((needed_size == 0) ? 512u : static_cast<std::size_t>(needed_size));
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        needed_size = 0;
        status = nt_query_object(
            duplicated,
            object_class,
            buffer.data(),
            static_cast<ULONG>(buffer.size()),
            &needed_size
        );

        if (status != STATUS_INFO_LENGTH_MISMATCH) {
            break;
        }

        const std::size_t next = detail::grow_buffer_size(buffer.size(), needed_size);
        if (next <= buffer.size()) {
            return std::unexpected(std::make_error_code(std::errc::value_too_large));
        }
        buffer.resize(next);
    }

    if (status != STATUS_SUCCESS) {
        return std::unexpected(ntstatus_error(status));
    }

    const UNICODE_STRING* unicode = nullptr;
    if (info_class == kObjectTypeInformation) {
        unicode = &reinterpret_cast<const OBJECT_TYPE_INFORMATION_HEAD*>(buffer.data())->TypeName;
    } else {
        unicode = &reinterpret_cast<const OBJECT_NAME_INFORMATION_HEAD*>(buffer.data())->Name;
    }

    if (unicode->Buffer == nullptr || unicode->Length == 0) {
        return std::string{};
    }

    return utils::utf16_to_utf8(std::wstring_view(unicode->Buffer, unicode->Length / sizeof(wchar_t)));
}

// "\Device\HarddiskVolume3" -> "C:" for every mounted drive letter.
constexpr std::chrono::seconds kDeviceRefreshInterval{1};

[[nodiscard]] DeviceTable query_dos_devices() {
    DeviceTable devices;
    wchar_t drive[] = L"A:";
    std::vector<wchar_t> target(MAX_PATH, L'\0');
    for (wchar_t letter = L'A'; letter <= L'Z'; ++letter) {
        drive[0] = letter;
        const DWORD length = ::QueryDosDeviceW(drive, target.data(), static_cast<DWORD>(target.size()));
        if (length == 0) {
            continue;
        }
        devices.emplace_back(utils::utf16_to_utf8(std::wstring_view(target.data())),
                             utils::utf16_to_utf8(std::wstring_view(drive)));
    }
    return devices;
}

} // namespace

namespace detail {

std::size_t grow_buffer_size(std::size_t current, ULONG needed) {
    std::size_t next = current * 2;
    const std::size_t needed_size = static_cast<std::size_t>(needed);
    if (needed_size > next) {
        next = needed_size + (needed_size / 4);
    }

    if (next < current || next > static_cast<std::size_t>(std::numeric_limits<ULONG>::max())) {
        return static_cast<std::size_t>(std::numeric_limits<ULONG>::max());
    }

    return next;
}

bool buffer_has_complete_payload(std::size_t buffer_size, std::size_t handle_count) {
    const std::size_t header_size = offsetof(SYSTEM_HANDLE_INFORMATION_EX, Handles);
    if (buffer_size < header_size) {
        return false;
    }

    const std::size_t max_entries = (buffer_size - header_size) / sizeof(SYSTEM_HANDLE_TABLE_ENTRY_INFO_EX);
    return handle_count <= max_entries;
}

std::string replace_device_prefix(const std::string& nt_path, const DeviceTable& devices) {
    for (const auto& [device, drive] : devices) {
        if (device.empty() || nt_path.size() < device.size()) {
            continue;
        }
        if (!utils::equals_ignore_case(std::string_view(nt_path).substr(0, device.size()), device)) {
            continue;
        }
        // Only match whole components: "\Device\HarddiskVolume1" must not match "...Volume10".
        if (nt_path.size() > device.size() && nt_path[device.size()] != '\\') {
            continue;
        }
        return drive + nt_path.substr(device.size());
    }
    return nt_path;
}

std::optional<std::string> DosPathResolver::resolve(const std::string& nt_path) {
    const std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = std::chrono::steady_clock::now();
    if (m_loads > 0) {
        if (auto converted = lookup(nt_path)) {
            return converted;
        }
        if (now - m_lastLoad < m_refreshInterval) {
            return std::nullopt;
        }
    }

    m_devices = m_loader();
    m_lastLoad = now;
    ++m_loads;
    return lookup(nt_path);
}

std::optional<std::string> DosPathResolver::lookup(const std::string& nt_path) const {
    std::string converted = replace_device_prefix(nt_path, m_devices);
    if (converted == nt_path) {
        return std::nullopt;
    }
    return converted;
}

} // namespace detail

std::expected<void, std::error_code> enable_debug_privilege() {
    HANDLE raw_token = nullptr;
    if (!::OpenProcessToken(::GetCurrentProcess(), TOKEN_ADJUST_PRIVILEGES | TOKEN_QUERY, &raw_token)) {
        return std::unexpected(last_error_code());
    }
    const UniqueHandle token_handle(raw_token);

    LUID luid;
    if (!::LookupPrivilegeValueW(nullptr, L"SeDebugPrivilege", &luid)) {
        return std::unexpected(last_error_code());
    }

    TOKEN_PRIVILEGES tp{};
    tp.PrivilegeCount = 1;
    tp.Privileges[0].Luid = luid;
    tp.Privileges[0].Attributes = SE_PRIVILEGE_ENABLED;

    ::SetLastError(ERROR_SUCCESS);
    if (!::AdjustTokenPrivileges(token_handle.get(), FALSE, &tp, sizeof(TOKEN_PRIVILEGES), nullptr, nullptr)) {
        return std::unexpected(last_error_code());
    }

    if (::GetLastError() != ERROR_SUCCESS) {
        return std::unexpected(last_error_code());
    }

    return {};
}

std::expected<std::vector<RawHandle>, std::error_code> query_handles(const std::vector<DWORD>& pids) {
    static const auto nt_query_info =
        load_ntdll_export<NtQuerySystemInformationPtr>("NtQuerySystemInformation");
    if (!nt_query_info) {
        return std::unexpected(std::make_error_code(std::errc::not_supported));
    }

    ULONG needed_size = 0;
    std::vector<std::byte> buffer(kInitialBufferSize);
    NTSTATUS status = 0;

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        status = nt_query_info(
            SystemExtendedHandleInformation,
            buffer.data(),
            static_cast<ULONG>(buffer.size()),
            &needed_size
        );

        if (status != STATUS_INFO_LENGTH_MISMATCH) {
            break;
        }

        const std::size_t next = detail::grow_buffer_size(buffer.size(), needed_size);
        if (next <= buffer.size()) {
            return std::unexpected(std::make_error_code(std::errc::value_too_large));
        }
        buffer.resize(next);
    }

    if (status != STATUS_SUCCESS) {
        return std::unexpected(ntstatus_error(status));
    }

    const auto* handle_info = reinterpret_cast<const SYSTEM_HANDLE_INFORMATION_EX*>(buffer.data());
    const std::size_t handle_count = static_cast<std::size_t>(handle_info->NumberOfHandles);

    if (!detail::buffer_has_complete_payload(buffer.size(), handle_count)) {
        return std::unexpected(std::make_error_code(std::errc::result_out_of_range));
    }

    const std::unordered_set<ULONG_PTR> wanted(pids.begin(), pids.end());
    std::vector<RawHandle> result;
    for (std::size_t i = 0; i < handle_count; ++i) {
        const auto& entry = handle_info->Handles[i];
        if (!wanted.contains(entry.UniqueProcessId)) {
            continue;
        }
        result.push_back(RawHandle{
            .processId = static_cast<std::uintptr_t>(entry.UniqueProcessId),
            .handleValue = static_cast<std::uintptr_t>(entry.HandleValue),
            .grantedAccess = static_cast<std::uint32_t>(entry.GrantedAccess),
            .objectTypeIndex = static_cast<std::uint16_t>(entry.ObjectTypeIndex)
        });
    }

    return result;
}

std::expected<std::string, Error> query_object_type(const RawHandle& handle) noexcept {
    try {
        static const auto nt_query_object = load_ntdll_export<NtQueryObjectPtr>("NtQueryObject");
        if (!nt_query_object) {
            return make_error(std::errc::not_supported);
        }

        auto duplicated = duplicate_to_current_process(handle);
        if (!duplicated) {
            return std::unexpected(duplicated.error());
        }

        return query_unicode_information(nt_query_object, duplicated->get(), kObjectTypeInformation);
    } catch (const std::bad_alloc&) {
        return make_error(std::errc::not_enough_memory);
    }
}

std::expected<std::string, Error> query_object_name(const RawHandle& handle) noexcept {
    try {
        if (handle.grantedAccess == 0) {
            return make_error(std::errc::permission_denied);
        }

        if (looks_like_sync_pipe_file(handle)) {
            return make_error(std::errc::operation_would_block);
        }

        static const auto nt_query_object = load_ntdll_export<NtQueryObjectPtr>("NtQueryObject");
        if (!nt_query_object) {
            return make_error(std::errc::not_supported);
        }

        auto duplicated = duplicate_to_current_process(handle);
        if (!duplicated) {
            return std::unexpected(duplicated.error());
        }

        // Only disk files have a meaningful path.
        if (::GetFileType(duplicated->get()) != FILE_TYPE_DISK) {
            return make_error(std::errc::not_supported);
        }

        return query_unicode_information(nt_query_object, duplicated->get(), kObjectNameInformation);
    } catch (const std::bad_alloc&) {
        return make_error(std::errc::not_enough_memory);
    }
}

std::expected<std::string, Error> to_dos_path(const std::string& nt_path) {
    static detail::DosPathResolver resolver(query_dos_devices, kDeviceRefreshInterval);
    auto converted = resolver.resolve(nt_path);
    if (!converted) {
        return make_error(std::errc::no_such_device);
    }
    return std::move(*converted);
}

std::expected<std::vector<std::pair<DWORD, DWORD>>, std::error_code> query_parent_pids() {
    const UniqueHandle snapshot(::CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
    if (!snapshot) {
        return std::unexpected(last_error_code());
    }

    PROCESSENTRY32W entry{};
    entry.dwSize = sizeof(entry);
    if (!::Process32FirstW(snapshot.get(), &entry)) {
        return std::unexpected(last_error_code());
    }

    std::vector<std::pair<DWORD, DWORD>> parents;
    do {
        parents.emplace_back(entry.th32ProcessID, entry.th32ParentProcessID);
    } while (::Process32NextW(snapshot.get(), &entry));

    return parents;
}

} // namespace nt
