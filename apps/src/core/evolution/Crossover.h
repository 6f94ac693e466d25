#pragma once

#include "EvolutionConfig.h"
#include "core/brains/FeedforwardPolicy.h"

#include <optional>
#include <random>

namespace FlapEvo {

// Each parameter taken from either parent with equal probability.
FeedforwardPolicy crossoverUniform(
    const FeedforwardPolicy& a,
    const FeedforwardPolicy& b,
    std::mt19937& rng,
    std::optional<WeightType> clipLimit = std::nullopt);

// Each parameter is the mean of the parents' values.
FeedforwardPolicy crossoverAverage(
    const FeedforwardPolicy& a,
    const FeedforwardPolicy& b,
    std::optional<WeightType> clipLimit = std::nullopt);

FeedforwardPolicy crossover(
    CrossoverMode mode,
    const FeedforwardPolicy& a,
    const FeedforwardPolicy& b,
    std::mt19937& rng,
    std::optional<WeightType> clipLimit = std::nullopt);

} // namespace FlapEvo
