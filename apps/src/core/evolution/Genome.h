#pragma once

#include "core/brains/FeedforwardPolicy.h"

#include <cstdint>
#include <random>

namespace FlapEvo {

/**
 * One individual: a policy plus its per-episode run state.
 *
 * Fitness is score-dominant: one more obstacle passed always outranks any distance
 * below FITNESS_SCORE_WEIGHT.
 */
struct Genome {
    static constexpr double FITNESS_SCORE_WEIGHT = 1000.0;

    FeedforwardPolicy policy;
    uint32_t color = 0xFFFFFFFF; // Display tint (RGBA), fixed for the genome's lifetime.

    bool alive = true;
    int score = 0;
    double distance = 0.0;

    Genome() = default;
    Genome(FeedforwardPolicy policy, uint32_t color);

    // Fresh genome with a random display hue.
    static Genome withRandomColor(FeedforwardPolicy policy, std::mt19937& rng);

    double fitness() const { return score * FITNESS_SCORE_WEIGHT + distance; }

    void resetRunState();
};

} // namespace FlapEvo
