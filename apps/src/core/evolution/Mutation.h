#pragma once

#include "EvolutionConfig.h"
#include "core/brains/FeedforwardPolicy.h"

#include <optional>
#include <random>

namespace FlapEvo {

struct MutationParams {
    double rate = 0.0;
    double step = 0.0;
    std::optional<WeightType> clipLimit; // Clip after mutating when set.
};

struct MutationStats {
    int perturbations = 0;
};

/**
 * Perturb each parameter independently with probability `rate` by a value drawn
 * uniformly from [-step, step], then clip. A rate of zero never touches a parameter.
 */
void mutate(
    FeedforwardPolicy& policy,
    const MutationParams& params,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

// Mutation rate and step for the next generation, given this generation's best score.
MutationParams computeMutationParams(
    const MutationConfig& config, MutationSchedule schedule, int bestScore);

} // namespace FlapEvo
