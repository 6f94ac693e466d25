#include "Crossover.h"

namespace FlapEvo {

FeedforwardPolicy crossoverUniform(
    const FeedforwardPolicy& a,
    const FeedforwardPolicy& b,
    std::mt19937& rng,
    std::optional<WeightType> clipLimit)
{
    std::bernoulli_distribution pickA(0.5);

    FeedforwardPolicy child = FeedforwardPolicy::zero(a.activation());
    auto& values = child.parameters().values;
    const auto& aValues = a.parameters().values;
    const auto& bValues = b.parameters().values;

    for (size_t i = 0; i < values.size(); i++) {
        values[i] = pickA(rng) ? aValues[i] : bValues[i];
    }

    if (clipLimit.has_value()) {
        clipAll(child.parameters(), clipLimit.value());
    }
    return child;
}

FeedforwardPolicy crossoverAverage(
    const FeedforwardPolicy& a, const FeedforwardPolicy& b, std::optional<WeightType> clipLimit)
{
    FeedforwardPolicy child = FeedforwardPolicy::zero(a.activation());
    auto& values = child.parameters().values;
    const auto& aValues = a.parameters().values;
    const auto& bValues = b.parameters().values;

    for (size_t i = 0; i < values.size(); i++) {
        values[i] = (aValues[i] + bValues[i]) * 0.5;
    }

    if (clipLimit.has_value()) {
        clipAll(child.parameters(), clipLimit.value());
    }
    return child;
}

FeedforwardPolicy crossover(
    CrossoverMode mode,
    const FeedforwardPolicy& a,
    const FeedforwardPolicy& b,
    std::mt19937& rng,
    std::optional<WeightType> clipLimit)
{
    switch (mode) {
        case CrossoverMode::Uniform:
            return crossoverUniform(a, b, rng, clipLimit);
        case CrossoverMode::Average:
            return crossoverAverage(a, b, clipLimit);
    }
    return crossoverUniform(a, b, rng, clipLimit);
}

} // namespace FlapEvo
