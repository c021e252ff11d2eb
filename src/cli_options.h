/**
 * @file cli_options.h
 * @brief Command-line options for the console harness.
 */

#pragma once

#include <cstdint>
#include <string>

struct CliOptions {
    std::string preset_path;
    bool   has_target = false;
    double target_m = 0.0;
    bool   has_wind = false;
    double wind_ms = 0.0;
    bool   has_angle = false;
    double angle_deg = 0.0;
    bool   has_seed = false;
    uint32_t seed = 0;
    bool   print_path = false;
    bool   dump_preset = false;
    bool   verbose = false;
};

/**
 * Parse a finite decimal number; the whole string must be consumed.
 */
bool ParseDouble(const char* text, double& out);

/**
 * Parse an unsigned 32-bit seed in base 10. Rejects signs, fractions,
 * trailing characters and values above UINT32_MAX.
 */
bool ParseSeed(const char* text, uint32_t& out);

/**
 * Parse argv into opt. Returns false on an unknown flag, a missing value or
 * a malformed number.
 */
bool ParseArgs(int argc, char** argv, CliOptions& opt);

void PrintUsage(const char* argv0);
