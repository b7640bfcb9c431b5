#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace utils {

[[nodiscard]] std::string to_lower_ascii(std::string_view text);
[[nodiscard]] bool equals_ignore_case(std::string_view left, std::string_view right);
[[nodiscard]] bool contains_whitespace(std::string_view text) noexcept;
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

#ifdef _WIN32
[[nodiscard]] std::string utf16_to_utf8(std::wstring_view wide);
[[nodiscard]] std::wstring utf8_to_utf16(std::string_view text);
#endif

} // namespace utils
