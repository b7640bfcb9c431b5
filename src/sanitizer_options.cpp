#include "sanitizer_options.hpp"

#include "log.hpp"
#include "path_utils.hpp"
#include "string_utils.hpp"

#include <utility>

namespace sanitizer {

namespace detail {

bool is_separator_at(const std::string_view raw, const std::size_t index) noexcept {
    if (index >= raw.size() || raw[index] != kDelimiter) {
        return false;
    }

    if (index > 0 && raw[index - 1] == kEscape) {
        return false;
    }

    // Paths such as "C:\dir" or "file:///x" keep their colon.
    if (index + 1 < raw.size()) {
        const char next = raw[index + 1];
        if (next == '\\' || next == '|' || next == '/') {
            return false;
        }
    }

    return true;
}

std::vector<std::string> split_options(const std::string_view raw) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (is_separator_at(raw, i)) {
            tokens.emplace_back(raw.substr(start, i - start));
            start = i + 1;
        }
    }
    tokens.emplace_back(raw.substr(start));
    return tokens;
}

} // namespace detail

namespace {

struct Token {
    std::string name;
    std::string value;
};

[[nodiscard]] std::optional<Token> split_token(const std::string_view token) {
    const std::size_t equals = token.find('=');
    if (equals == std::string_view::npos || equals == 0) {
        return std::nullopt;
    }

    if (token.find('=', equals + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    return Token{std::string(token.substr(0, equals)), std::string(token.substr(equals + 1))};
}

} // namespace

void OptionStore::add(std::string name, std::string value, const bool overwrite) {
    if (overwrite) {
        m_options.insert_or_assign(std::move(name), std::move(value));
        return;
    }
    m_options.try_emplace(std::move(name), std::move(value));
}

std::expected<void, std::error_code> OptionStore::load(const std::string_view raw, const std::string_view source) {
    if (utils::contains_whitespace(raw)) {
        logging::error("{} should not contain spaces, join options with '{}'", source, kDelimiter);
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    Options parsed;
    for (const std::string& option : detail::split_options(raw)) {
        auto token = split_token(option);
        if (!token) {
            logging::warning("Malformed option in {}: '{}'", source, option);
            continue;
        }

        if (token->name == kSuppressionsOption) {
            token->value = utils::normalize_path(utils::expand_user(token->value));
            if (!utils::is_regular_file(token->value)) {
                logging::error("Suppressions file '{}' does not exist", token->value);
                return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
            }
        }

        parsed.insert_or_assign(std::move(token->name), std::move(token->value));
    }

    for (auto& [name, value] : parsed) {
        m_options.insert_or_assign(name, std::move(value));
    }
    return {};
}

std::expected<void, std::error_code> OptionStore::load_from(const std::map<std::string, std::string>& environment,
                                                           const std::string& key) {
    const auto it = environment.find(key);
    if (it == environment.end()) {
        return {};
    }
    return load(it->second, key);
}

std::string OptionStore::serialize() const {
    std::vector<std::string> tokens;
    tokens.reserve(m_options.size());
    for (const auto& [name, value] : m_options) {
        tokens.push_back(name + '=' + value);
    }
    return utils::join(tokens, std::string_view(&kDelimiter, 1));
}

std::optional<std::string> OptionStore::get(const std::string& name) const {
    if (const auto it = m_options.find(name); it != m_options.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool OptionStore::contains(const std::string& name) const {
    return m_options.contains(name);
}

} // namespace sanitizer
