#include "printer.hpp"

#include <fmt/format.h>

#include <iostream>

void ReportPrinter::print_environment(const env::Environment& environment) const {
    for (const auto& [name, value] : environment) {
        std::cout << fmt::format("{}={}\n", name, value);
    }
}

void ReportPrinter::print_wait_result(const uint32_t pid, const bool released, const bool verbose) const {
    if (released) {
        if (verbose) {
            std::cout << fmt::format("Process {} released all files.\n", pid);
        }
        return;
    }

    std::cout << fmt::format("Timed out waiting for process {} to release files.\n", pid);
}

void ReportPrinter::print_profile(const std::filesystem::path& profile) const {
    std::cout << fmt::format("{}\n", profile.string());
}
