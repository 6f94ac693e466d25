#include "Mutation.h"

#include <algorithm>

namespace FlapEvo {

void mutate(
    FeedforwardPolicy& policy,
    const MutationParams& params,
    std::mt19937& rng,
    MutationStats* stats)
{
    if (stats) {
        stats->perturbations = 0;
    }

    std::uniform_real_distribution<WeightType> coin(0.0, 1.0);
    std::uniform_real_distribution<WeightType> noise(-params.step, params.step);

    auto& parameters = policy.parameters();
    for (auto& value : parameters.values) {
        if (coin(rng) < params.rate) {
            value += noise(rng);
            if (stats) {
                stats->perturbations++;
            }
        }
    }

    if (params.clipLimit.has_value()) {
        clipAll(parameters, params.clipLimit.value());
    }
}

MutationParams computeMutationParams(
    const MutationConfig& config, MutationSchedule schedule, int bestScore)
{
    if (schedule == MutationSchedule::Fixed) {
        return MutationParams{ .rate = config.fixedRate, .step = config.fixedStep };
    }

    if (bestScore < config.midScoreThreshold) {
        return MutationParams{ .rate = config.baseRate, .step = config.baseStep };
    }
    if (bestScore < config.lateScoreThreshold) {
        return MutationParams{
            .rate = std::max(config.minRate, config.midRate),
            .step = std::max(config.minStep, config.midStep),
        };
    }
    return MutationParams{
        .rate = std::max(config.minRate, config.lateRate),
        .step = std::max(config.minStep, config.lateStep),
    };
}

} // namespace FlapEvo
