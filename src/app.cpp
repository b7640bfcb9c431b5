#include "app.hpp"

#include "cli_parser.hpp"
#include "environment.hpp"
#include "log.hpp"
#include "printer.hpp"
#include "profile.hpp"
#include "release_waiter.hpp"

#include <cstdlib>
#include <filesystem>

int HarnessPrepApp::run_env(const CliOptions& options) {
    auto environment = env::prepare_environment(env::current_environment(),
                                                 *options.targetDir,
                                                 *options.sanitizerLog,
                                                 options.overrides);
    if (!environment) {
        logging::error("failed to prepare environment ({})", environment.error().message());
        return EXIT_FAILURE;
    }

    const ReportPrinter printer;
    printer.print_environment(*environment);
    return EXIT_SUCCESS;
}

int HarnessPrepApp::run_wait(const CliOptions& options) {
    const proc::WaitOptions wait_options{
        .pollInterval = proc::Seconds(options.pollInterval),
        .recursive = options.recursive,
        .timeout = proc::Seconds(options.timeout)
    };

    auto released = proc::wait_on_files(*options.pid, options.files, wait_options);
    if (!released) {
        logging::error("failed to wait on files ({})", released.error().message());
        return EXIT_FAILURE;
    }

    const ReportPrinter printer;
    printer.print_wait_result(*options.pid, *released, options.verbose);
    return *released ? EXIT_SUCCESS : EXIT_FAILURE;
}

int HarnessPrepApp::run_profile(const CliOptions& options) {
    profile::ProfileOptions profile_options;
    if (options.prefsJs) {
        profile_options.prefsJs = *options.prefsJs;
    }
    if (options.templateDir) {
        profile_options.templateDir = *options.templateDir;
    }
    profile_options.extensions.assign(options.extensions.begin(), options.extensions.end());

    auto created = profile::create_profile(profile_options);
    if (!created) {
        logging::error("failed to create profile ({})", created.error().message());
        return EXIT_FAILURE;
    }

    const ReportPrinter printer;
    printer.print_profile(*created);
    return EXIT_SUCCESS;
}

int HarnessPrepApp::run_check_prefs(const CliOptions& options) {
    auto complete = profile::check_prefs(options.positional[0], options.positional[1]);
    if (!complete) {
        logging::error("failed to check prefs ({})", complete.error().message());
        return EXIT_FAILURE;
    }

    if (!*complete) {
        logging::warning("not all prefs are set, run with -v for details");
    }
    return *complete ? EXIT_SUCCESS : EXIT_FAILURE;
}

int HarnessPrepApp::run(int argc, char* argv[]) {
    auto parse_result = cli::parse(argc, argv);
    if (!parse_result) {
        if (parse_result.error().empty()) {
            cli::print_help();
            return EXIT_SUCCESS;
        }

        logging::error("{}", parse_result.error());
        return EXIT_FAILURE;
    }

    const CliOptions& options = parse_result.value();
    logging::set_level(options.verbose ? logging::Level::Debug : logging::Level::Info);

    switch (options.command) {
    case Command::Env:
        return run_env(options);
    case Command::Wait:
        return run_wait(options);
    case Command::Profile:
        return run_profile(options);
    case Command::CheckPrefs:
        return run_check_prefs(options);
    case Command::None:
        break;
    }

    cli::print_help();
    return EXIT_FAILURE;
}
