#include "string_utils.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

#include <cctype>

namespace utils {

std::string to_lower_ascii(const std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (const char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return lower;
}

bool equals_ignore_case(const std::string_view left, const std::string_view right) {
    return to_lower_ascii(left) == to_lower_ascii(right);
}

bool contains_whitespace(const std::string_view text) noexcept {
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            return true;
        }
    }
    return false;
}

std::string join(const std::vector<std::string>& parts, const std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            joined.append(separator);
        }
        joined.append(parts[i]);
    }
    return joined;
}

#ifdef _WIN32

std::string utf16_to_utf8(const std::wstring_view wide) {
    if (wide.empty()) {
        return {};
    }

    const int size = ::WideCharToMultiByte(
        CP_UTF8,
        0,
        wide.data(),
        static_cast<int>(wide.size()),
        nullptr,
        0,
        nullptr,
        nullptr
    );

    if (size <= 0) {
        return {};
    }

    std::string utf8(static_cast<std::size_t>(size), '\0');
    const int written = ::WideCharToMultiByte(
        CP_UTF8,
        0,
        wide.data(),
        static_cast<int>(wide.size()),
        utf8.data(),
        size,
        nullptr,
        nullptr
    );

    if (written <= 0) {
        return {};
    }

    return utf8;
}

std::wstring utf8_to_utf16(const std::string_view text) {
    if (text.empty()) {
        return {};
    }

    const int size = ::MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    if (size <= 0) {
        return {};
    }

    std::wstring wide(static_cast<std::size_t>(size), L'\0');
    if (::MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), wide.data(), size) <= 0) {
        return {};
    }

    return wide;
}

#endif

} // namespace utils
