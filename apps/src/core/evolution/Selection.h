#pragma once

#include "EvolutionConfig.h"

#include <cstddef>
#include <random>
#include <vector>

namespace FlapEvo {

/**
 * Tournament selection: draw k indices uniformly (with replacement), return the fittest.
 * k is clamped to [2, pool size] except that a single-entry pool still draws twice.
 * Returns an index into `fitness`.
 */
size_t tournamentSelect(const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng);

// Uniform pick from the pool.
size_t randomSelect(size_t poolSize, std::mt19937& rng);

size_t selectParent(
    SelectionMode mode,
    const std::vector<double>& fitness,
    int tournamentSize,
    std::mt19937& rng);

// Number of unmutated survivors: max(minElites, popSize * fraction), within [2, popSize].
int computeEliteCount(int populationSize, double eliteFraction, int minEliteCount);

} // namespace FlapEvo
