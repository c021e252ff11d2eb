/**
 * @file scenario_generator.h
 * @brief Randomized target/wind scenarios for practice shots.
 *
 * Produces values inside the engine's accepted domain. Seeded, so a given
 * seed always yields the same sequence of scenarios.
 */

#pragma once

#include "ctk/ctk_config.h"
#include <cstdint>
#include <random>

struct Scenario {
    double target_range_m;   // whole meters
    double wind_ms;          // one decimal place
};

class ScenarioGenerator {
public:
    explicit ScenarioGenerator(uint32_t seed = 0);

    void reseed(uint32_t seed);

    Scenario next();

private:
    std::mt19937 rng_;
};
