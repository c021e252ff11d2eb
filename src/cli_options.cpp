/**
 * @file cli_options.cpp
 * @brief Command-line option parsing.
 */

#include "cli_options.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

bool ParseDouble(const char* text, double& out) {
    if (!text || *text == '\0') return false;
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text, &end);
    if (errno != 0 || !end || *end != '\0' || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool ParseSeed(const char* text, uint32_t& out) {
    // strtoul accepts leading whitespace and a sign; a seed is digits only
    if (!text || !std::isdigit(static_cast<unsigned char>(*text))) return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || !end || *end != '\0' || value > UINT32_MAX) return false;
    out = static_cast<uint32_t>(value);
    return true;
}

bool ParseArgs(int argc, char** argv, CliOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (std::strcmp(arg, "--preset") == 0 && value) {
            opt.preset_path = value;
            ++i;
        } else if (std::strcmp(arg, "--target") == 0 && value) {
            if (!ParseDouble(value, opt.target_m)) return false;
            opt.has_target = true;
            ++i;
        } else if (std::strcmp(arg, "--wind") == 0 && value) {
            if (!ParseDouble(value, opt.wind_ms)) return false;
            opt.has_wind = true;
            ++i;
        } else if (std::strcmp(arg, "--angle") == 0 && value) {
            if (!ParseDouble(value, opt.angle_deg)) return false;
            opt.has_angle = true;
            ++i;
        } else if (std::strcmp(arg, "--seed") == 0 && value) {
            if (!ParseSeed(value, opt.seed)) return false;
            opt.has_seed = true;
            ++i;
        } else if (std::strcmp(arg, "--path") == 0) {
            opt.print_path = true;
        } else if (std::strcmp(arg, "--dump-preset") == 0) {
            opt.dump_preset = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            opt.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
                 "usage: %s [--preset FILE] [--target M] [--wind MS] [--angle DEG]\n"
                 "          [--seed N] [--path] [--dump-preset] [--verbose]\n",
                 argv0);
}
