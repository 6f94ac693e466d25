#include "Selection.h"

#include "core/Assert.h"

#include <algorithm>

namespace FlapEvo {

size_t tournamentSelect(const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng)
{
    FLAPEVO_ASSERT(!fitness.empty(), "Tournament selection needs a non-empty pool");

    const int poolSize = static_cast<int>(fitness.size());
    const int k = std::max(2, std::min(tournamentSize, poolSize));

    std::uniform_int_distribution<size_t> dist(0, fitness.size() - 1);

    size_t bestIdx = dist(rng);
    double bestFitness = fitness[bestIdx];

    for (int i = 1; i < k; i++) {
        const size_t idx = dist(rng);
        if (fitness[idx] > bestFitness) {
            bestIdx = idx;
            bestFitness = fitness[idx];
        }
    }

    return bestIdx;
}

size_t randomSelect(size_t poolSize, std::mt19937& rng)
{
    FLAPEVO_ASSERT(poolSize > 0, "Random selection needs a non-empty pool");

    std::uniform_int_distribution<size_t> dist(0, poolSize - 1);
    return dist(rng);
}

size_t selectParent(
    SelectionMode mode, const std::vector<double>& fitness, int tournamentSize, std::mt19937& rng)
{
    switch (mode) {
        case SelectionMode::Tournament:
            return tournamentSelect(fitness, tournamentSize, rng);
        case SelectionMode::RandomPair:
            return randomSelect(fitness.size(), rng);
    }
    return randomSelect(fitness.size(), rng);
}

int computeEliteCount(int populationSize, double eliteFraction, int minEliteCount)
{
    const int populationFloor = std::max(2, populationSize);
    const int fromFraction = static_cast<int>(static_cast<double>(populationSize) * eliteFraction);
    const int count = std::max({ 2, minEliteCount, fromFraction });
    return std::min(count, populationFloor);
}

} // namespace FlapEvo
