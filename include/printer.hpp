#pragma once

#include "environment.hpp"

#include <cstdint>
#include <filesystem>

class ReportPrinter {
public:
    void print_environment(const env::Environment& environment) const;
    void print_wait_result(uint32_t pid, bool released, bool verbose) const;
    void print_profile(const std::filesystem::path& profile) const;
};
