#include "environment.hpp"

#include "log.hpp"
#include "path_utils.hpp"
#include "sanitizer_options.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <span>
#include <string>

#ifndef _WIN32
extern char** environ;
#endif

namespace env {

namespace {

[[nodiscard]] char** process_environ() noexcept {
#ifdef _WIN32
    return _environ;
#else
    return environ;
#endif
}

void apply_defaults(sanitizer::OptionStore& store, const std::span<const SanitizerDefault> defaults) {
    for (const SanitizerDefault& entry : defaults) {
        store.add(std::string(entry.option), std::string(entry.value), entry.forced);
    }
}

// Loads the existing option string for `variable`, applies defaults and writes it back.
std::expected<void, std::error_code> configure_family(Environment& environment,
                                                      const std::string_view variable,
                                                      const std::span<const SanitizerDefault> defaults,
                                                      const std::optional<std::string>& log_path) {
    sanitizer::OptionStore store;
    if (auto loaded = store.load_from(environment, std::string(variable)); !loaded) {
        return std::unexpected(loaded.error());
    }

    apply_defaults(store, defaults);
    if (log_path) {
        // log_path is required for sanitizer logging to function.
        store.add("log_path", *log_path, true);
    }

    environment.insert_or_assign(std::string(variable), store.serialize());
    return {};
}

void resolve_symbolizer(Environment& environment, const std::filesystem::path& target_dir) {
    const std::string key(kSymbolizerPath);
    if (const auto it = environment.find(key); it != environment.end()) {
        if (!utils::is_regular_file(it->second)) {
            logging::warning("Invalid {} ({})", kSymbolizerPath, it->second);
        }
        return;
    }

    const std::filesystem::path symbolizer = target_dir / kSymbolizerBinary;
    if (utils::is_regular_file(symbolizer)) {
        environment.insert_or_assign(key, symbolizer.string());
        return;
    }

#ifndef _WIN32
    logging::warning("{} should be next to the target binary ({})", kSymbolizerBinary, target_dir.string());
#endif
}

} // namespace

Environment current_environment() {
    Environment environment;
    char** entries = process_environ();
    if (!entries) {
        return environment;
    }

    for (; *entries; ++entries) {
        const std::string_view entry(*entries);
        const std::size_t equals = entry.find('=');
        // Windows keeps per-drive entries such as "=C:=C:\\"; skip anything unnamed.
        if (equals == std::string_view::npos || equals == 0) {
            continue;
        }
        environment.try_emplace(std::string(entry.substr(0, equals)), std::string(entry.substr(equals + 1)));
    }
    return environment;
}

std::expected<void, std::error_code> configure_sanitizers(Environment& environment,
                                                          const std::filesystem::path& target_dir,
                                                          const std::string_view sanitizer_log) {
    const std::string log_path = fmt::format("'{}'", sanitizer_log);

    if (auto result = configure_family(environment, kAsanOptions, kAsanDefaults, log_path); !result) {
        return result;
    }
    if (auto result = configure_family(environment, kLsanOptions, kLsanDefaults, std::nullopt); !result) {
        return result;
    }
    if (auto result = configure_family(environment, kUbsanOptions, kUbsanDefaults, log_path); !result) {
        return result;
    }

    resolve_symbolizer(environment, target_dir);
    return {};
}

std::expected<Environment, std::error_code> prepare_environment(Environment base,
                                                                const std::filesystem::path& target_dir,
                                                                const std::string_view sanitizer_log,
                                                                const Overrides& overrides) {
    for (const Toggle& toggle : kBrowserToggles) {
        if (toggle.forced) {
            base.insert_or_assign(std::string(toggle.name), std::string(toggle.value));
        } else {
            base.try_emplace(std::string(toggle.name), std::string(toggle.value));
        }
    }

    if (auto configured = configure_sanitizers(base, target_dir, sanitizer_log); !configured) {
        return std::unexpected(configured.error());
    }

    for (const auto& [name, value] : overrides) {
        if (value) {
            base.insert_or_assign(name, *value);
        } else {
            base.erase(name);
        }
    }

    return base;
}

} // namespace env
