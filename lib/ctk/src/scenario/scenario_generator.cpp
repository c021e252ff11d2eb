/**
 * @file scenario_generator.cpp
 * @brief Scenario generator implementation.
 */

#include "scenario_generator.h"
#include <cmath>

ScenarioGenerator::ScenarioGenerator(uint32_t seed) : rng_(seed) {}

void ScenarioGenerator::reseed(uint32_t seed) {
    rng_.seed(seed);
}

Scenario ScenarioGenerator::next() {
    std::uniform_real_distribution<double> target_dist(CTK_SCENARIO_TARGET_MIN_M,
                                                       CTK_SCENARIO_TARGET_MAX_M);
    std::uniform_real_distribution<double> wind_dist(CTK_SCENARIO_WIND_MIN_MS,
                                                     CTK_SCENARIO_WIND_MAX_MS);

    Scenario s;
    s.target_range_m = std::floor(target_dist(rng_));
    s.wind_ms = std::round(wind_dist(rng_) * 10.0) / 10.0;
    return s;
}
