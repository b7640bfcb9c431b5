#pragma once

#include "types.hpp"

class HarnessPrepApp {
public:
    int run(int argc, char* argv[]);

private:
    static int run_env(const CliOptions& options);
    static int run_wait(const CliOptions& options);
    static int run_profile(const CliOptions& options);
    static int run_check_prefs(const CliOptions& options);
};
