#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Top-level subcommands.
enum class Command { None, Env, Wait, Profile, CheckPrefs };

// Holds all parsed command-line arguments.
struct CliOptions {
    Command command = Command::None;
    // If true, debug messages are logged.
    bool verbose = false;

    // env: directory containing the browser binary.
    std::optional<std::string> targetDir;
    // env: log_path prefix for ASan and UBSan.
    std::optional<std::string> sanitizerLog;
    // env: std::nullopt removes the variable.
    std::map<std::string, std::optional<std::string>> overrides;

    // wait
    std::optional<uint32_t> pid;
    std::vector<std::string> files;
    double pollInterval = 0.1;
    double timeout = 60.0;
    bool recursive = true;

    // profile
    std::optional<std::string> prefsJs;
    std::optional<std::string> templateDir;
    std::vector<std::string> extensions;

    // check-prefs: profile prefs.js then input prefs.js.
    std::vector<std::string> positional;
};
