#include "cli_parser.hpp"
#include <fmt/format.h>
#include <charconv>
#include <expected>
#include <functional>
#include <iostream>
#include <map>
#include <string_view>
#include <vector>

namespace cli {

namespace {

template <typename Number>
std::expected<Number, std::string> parse_number(std::string_view text, std::string_view what) {
    Number value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::unexpected(fmt::format("Invalid {}: {}", what, text));
    }
    return value;
}

std::expected<Command, std::string> parse_command(std::string_view name) {
    static const std::map<std::string_view, Command> commands = {
        {"env", Command::Env},
        {"wait", Command::Wait},
        {"profile", Command::Profile},
        {"check-prefs", Command::CheckPrefs},
    };

    if (auto it = commands.find(name); it != commands.end()) {
        return it->second;
    }
    return std::unexpected(fmt::format("Unknown command: {}", name));
}

std::expected<void, std::string> validate(const CliOptions& options) {
    switch (options.command) {
    case Command::None:
        return std::unexpected("Missing command");
    case Command::Env:
        if (!options.targetDir) return std::unexpected("env requires -d <target_dir>");
        if (!options.sanitizerLog) return std::unexpected("env requires -l <log_prefix>");
        break;
    case Command::Wait:
        if (!options.pid) return std::unexpected("wait requires -p <pid>");
        if (options.files.empty()) return std::unexpected("wait requires at least one -f <file>");
        break;
    case Command::Profile:
        break;
    case Command::CheckPrefs:
        if (options.positional.size() != 2) {
            return std::unexpected("check-prefs requires <profile_prefs> <input_prefs>");
        }
        return {};
    }

    if (!options.positional.empty()) {
        return std::unexpected(fmt::format("Unexpected argument: {}", options.positional.front()));
    }
    return {};
}

} // namespace

/**
 * @brief Parses command-line arguments using a command-mapping approach.
 * The first positional argument selects the command; flags may appear anywhere.
 */
std::expected<CliOptions, std::string> parse(int argc, char* argv[]) {
    CliOptions options;
    std::vector<std::string_view> args(argv + 1, argv + argc);

    // Type definition for our argument handlers
    using Handler = std::function<std::expected<void, std::string>(size_t& i)>;

    // Mapping flags to their respective logic
    std::map<std::string_view, Handler> handlers = {
        {"-d", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -d");
            options.targetDir = std::string(args[i]); return {};
        }},

        {"-l", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -l");
            options.sanitizerLog = std::string(args[i]); return {};
        }},

        {"-s", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -s");
            const std::size_t equals = args[i].find('=');
            if (equals == std::string_view::npos || equals == 0) {
                return std::unexpected(fmt::format("Expected NAME=VALUE: {}", args[i]));
            }
            options.overrides.insert_or_assign(std::string(args[i].substr(0, equals)),
                                               std::string(args[i].substr(equals + 1)));
            return {};
        }},

        {"-u", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -u");
            options.overrides.insert_or_assign(std::string(args[i]), std::nullopt); return {};
        }},

        {"-p", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -p");
            auto pid = parse_number<uint32_t>(args[i], "PID");
            if (!pid) return std::unexpected(pid.error());
            options.pid = *pid; return {};
        }},

        {"-f", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -f");
            options.files.emplace_back(args[i]); return {};
        }},

        {"-i", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -i");
            auto interval = parse_number<double>(args[i], "poll interval");
            if (!interval) return std::unexpected(interval.error());
            options.pollInterval = *interval; return {};
        }},

        {"-t", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -t");
            auto timeout = parse_number<double>(args[i], "timeout");
            if (!timeout) return std::unexpected(timeout.error());
            options.timeout = *timeout; return {};
        }},

        {"-x", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -x");
            options.prefsJs = std::string(args[i]); return {};
        }},

        {"-T", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -T");
            options.templateDir = std::string(args[i]); return {};
        }},

        {"-e", [&](size_t& i) -> std::expected<void, std::string> {
            if (++i >= args.size()) return std::unexpected("Missing value for -e");
            options.extensions.emplace_back(args[i]); return {};
        }},

        {"--no-recursive", [&](size_t&) -> std::expected<void, std::string> { options.recursive = false; return {}; }},

        {"-v", [&](size_t&) -> std::expected<void, std::string> { options.verbose = true; return {}; }},

        {"-h", [&](size_t&) -> std::expected<void, std::string> { return std::unexpected(""); }}
    };

    handlers["--target-dir"] = handlers.at("-d");
    handlers["--log-prefix"] = handlers.at("-l");
    handlers["--set"] = handlers.at("-s");
    handlers["--unset"] = handlers.at("-u");
    handlers["--pid"] = handlers.at("-p");
    handlers["--file"] = handlers.at("-f");
    handlers["--poll"] = handlers.at("-i");
    handlers["--timeout"] = handlers.at("-t");
    handlers["--prefs"] = handlers.at("-x");
    handlers["--template"] = handlers.at("-T");
    handlers["--extension"] = handlers.at("-e");
    handlers["--verbose"] = handlers.at("-v");
    handlers["--help"] = handlers.at("-h");

    // Main parsing loop
    for (size_t i = 0; i < args.size(); ++i) {
        if (auto it = handlers.find(args[i]); it != handlers.end()) {
            auto result = it->second(i);
            if (!result) return std::unexpected(result.error());
        } else if (args[i].starts_with('-')) {
            return std::unexpected(fmt::format("Unknown argument: {}", args[i]));
        } else if (options.command == Command::None) {
            auto command = parse_command(args[i]);
            if (!command) return std::unexpected(command.error());
            options.command = *command;
        } else {
            options.positional.emplace_back(args[i]);
        }
    }

    if (auto valid = validate(options); !valid) {
        return std::unexpected(valid.error());
    }

    return options;
}

void print_help() {
    std::cout << "harness-prep <COMMAND> [OPTIONS]\n\n"
              << "Commands:\n"
              << "  env                        Print the environment for launching the browser\n"
              << "  wait                       Wait for a process tree to close files\n"
              << "  profile                    Create a profile directory and print its path\n"
              << "  check-prefs <prof> <input> Check that all input prefs are set in the profile\n\n"
              << "env options:\n"
              << "  -d, --target-dir <Dir>     Directory containing the browser binary\n"
              << "  -l, --log-prefix <Path>    Sanitizer log_path prefix\n"
              << "  -s, --set <Name=Value>     Set a variable (repeatable)\n"
              << "  -u, --unset <Name>         Remove a variable (repeatable)\n\n"
              << "wait options:\n"
              << "  -p, --pid <PID>            Process to watch\n"
              << "  -f, --file <Path>          File that must be closed (repeatable)\n"
              << "  -i, --poll <Seconds>       Delay between checks (default: 0.1)\n"
              << "  -t, --timeout <Seconds>    Time to wait (default: 60)\n"
              << "      --no-recursive         Do not scan child processes\n\n"
              << "profile options:\n"
              << "  -x, --prefs <prefs.js>     prefs.js to install\n"
              << "  -T, --template <Dir>       Profile directory to copy\n"
              << "  -e, --extension <File>     .xpi extension to install (repeatable)\n\n"
              << "  -v, --verbose              Log debug messages\n"
              << "  -h, --help                 Display help message\n";
}

} // namespace cli
