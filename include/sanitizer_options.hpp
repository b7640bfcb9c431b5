#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sanitizer {

    // Separator between options in *SAN_OPTIONS strings.
    inline constexpr char kDelimiter = ':';
    inline constexpr char kEscape = '\\';
    // Option whose value must reference an existing file.
    inline constexpr std::string_view kSuppressionsOption = "suppressions";

    namespace detail {
        // Splits a raw option string on ':' unless the colon is preceded by '\' or
        // followed by '\', '|' or '/'. Exposed for deterministic unit testing.
        std::vector<std::string> split_options(std::string_view raw);
        [[nodiscard]] bool is_separator_at(std::string_view raw, std::size_t index) noexcept;
    }

    /**
     * @brief Runtime options for one sanitizer family (ASan, LSan, UBSan).
     *
     * Options are seeded from an existing option string with load(), overlaid with
     * defaults via add(), then written back with serialize().
     */
    class OptionStore {
    public:
        using Options = std::map<std::string, std::string>;

        // Inserts name=value when name is absent, or always when overwrite is set.
        void add(std::string name, std::string value, bool overwrite = false);

        /**
         * @brief Parses `raw` into the store. Existing names are replaced.
         * @param source Variable name used in diagnostics.
         * @return invalid_argument when `raw` contains whitespace,
         *         no_such_file_or_directory when a suppressions file is missing.
         */
        std::expected<void, std::error_code> load(std::string_view raw, std::string_view source = "options");

        // Loads environment[key]; no-op when the key is absent.
        std::expected<void, std::error_code> load_from(const std::map<std::string, std::string>& environment,
                                                       const std::string& key);

        [[nodiscard]] std::string serialize() const;

        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] bool contains(const std::string& name) const;
        [[nodiscard]] std::size_t size() const noexcept { return m_options.size(); }
        [[nodiscard]] const Options& options() const noexcept { return m_options; }

    private:
        Options m_options;
    };

} // namespace sanitizer
