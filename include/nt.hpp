#pragma once

#include <windows.h>
#include <winternl.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include <expected>
#include <string>
#include <system_error>

namespace nt {

    // Status codes for NT API.
    using NTSTATUS = LONG;
    using Error = std::error_code;
    inline constexpr NTSTATUS STATUS_SUCCESS = 0x00000000;
    inline constexpr NTSTATUS STATUS_INFO_LENGTH_MISMATCH = static_cast<NTSTATUS>(0xC0000004u);

    // Use extended handle information for modern 64-bit safe layouts.
    inline constexpr SYSTEM_INFORMATION_CLASS SystemExtendedHandleInformation =
        static_cast<SYSTEM_INFORMATION_CLASS>(64);

    // NT device name to drive letter, e.g. "\Device\HarddiskVolume3" -> "C:".
    using DeviceTable = std::vector<std::pair<std::string, std::string>>;

    // One handle from the system handle table.
    struct RawHandle {
        std::uintptr_t processId{};
        std::uintptr_t handleValue{};
        std::uint32_t grantedAccess{};
        std::uint16_t objectTypeIndex{};
    };

    // Owns a kernel handle and closes it on destruction.
    class UniqueHandle {
    public:
        UniqueHandle() noexcept = default;
        explicit UniqueHandle(HANDLE handle) noexcept : m_handle(handle) {}
        UniqueHandle(const UniqueHandle&) = delete;
        UniqueHandle& operator=(const UniqueHandle&) = delete;
        UniqueHandle(UniqueHandle&& other) noexcept : m_handle(other.release()) {}
        UniqueHandle& operator=(UniqueHandle&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }
        ~UniqueHandle() { reset(); }

        [[nodiscard]] HANDLE get() const noexcept { return m_handle; }
        [[nodiscard]] explicit operator bool() const noexcept {
            return m_handle != nullptr && m_handle != INVALID_HANDLE_VALUE;
        }

        HANDLE release() noexcept {
            HANDLE handle = m_handle;
            m_handle = nullptr;
            return handle;
        }

        void reset(HANDLE handle = nullptr) noexcept {
            if (*this) {
                ::CloseHandle(m_handle);
            }
            m_handle = handle;
        }

    private:
        HANDLE m_handle = nullptr;
    };

    namespace detail {
        // Internal helpers exposed for deterministic unit testing.
        std::size_t grow_buffer_size(std::size_t current, ULONG needed);
        bool buffer_has_complete_payload(std::size_t buffer_size, std::size_t handle_count);
        // Rewrites "\Device\HarddiskVolume3\x" to "C:\x" given a device-to-drive table.
        std::string replace_device_prefix(const std::string& nt_path, const DeviceTable& devices);

        // Cached device table that is reloaded when a path matches no device, so drives
        // mounted after the first lookup still resolve. Reloads are rate limited.
        class DosPathResolver {
        public:
            using Loader = std::function<DeviceTable()>;

            DosPathResolver(Loader loader, std::chrono::steady_clock::duration refresh_interval)
                : m_loader(std::move(loader)), m_refreshInterval(refresh_interval) {}

            [[nodiscard]] std::optional<std::string> resolve(const std::string& nt_path);
            [[nodiscard]] std::size_t loads() const noexcept { return m_loads; }

        private:
            [[nodiscard]] std::optional<std::string> lookup(const std::string& nt_path) const;

            Loader m_loader;
            std::chrono::steady_clock::duration m_refreshInterval;
            std::chrono::steady_clock::time_point m_lastLoad{};
            DeviceTable m_devices;
            std::size_t m_loads = 0;
            std::mutex m_mutex;
        };
    }

    /**
     * @brief Elevates the current process privileges to SeDebugPrivilege.
     * @return std::expected<void, std::error_code> Success or error details.
     */
    std::expected<void, std::error_code> enable_debug_privilege();

    /**
     * @brief Retrieves the handles owned by any of `pids` from a single
     *        NtQuerySystemInformation snapshot of the system handle table.
     * @return std::expected<std::vector<RawHandle>, std::error_code> List of handles.
     */
    std::expected<std::vector<RawHandle>, std::error_code> query_handles(const std::vector<DWORD>& pids);

    /**
     * @brief Best-effort object type query for a raw handle.
     */
    [[nodiscard]] std::expected<std::string, Error> query_object_type(const RawHandle& handle) noexcept;

    /**
     * @brief Best-effort NT object name query for a raw handle.
     *        Synchronous pipes are refused since NtQueryObject can block on them.
     */
    [[nodiscard]] std::expected<std::string, Error> query_object_name(const RawHandle& handle) noexcept;

    /**
     * @brief Converts an NT device path to a drive-letter path.
     *        The drive table is reloaded (at most once a second) when nothing matches.
     */
    [[nodiscard]] std::expected<std::string, Error> to_dos_path(const std::string& nt_path);

    /**
     * @brief Parent pid of every process from a Toolhelp snapshot.
     */
    std::expected<std::vector<std::pair<DWORD, DWORD>>, std::error_code> query_parent_pids();

} // namespace nt
