#pragma once

#include "FeedforwardPolicy.h"

#include <optional>
#include <random>
#include <string>

namespace FlapEvo {

/**
 * Per-tick world measurements for one bird. Heights are measured above the ground.
 */
struct Observation {
    double birdY = 0.0;
    double topY = 0.0; // Upper edge of the next gap.
    double botY = 0.0; // Lower edge of the next gap.
    double distanceToObstacle = 0.0;
    std::optional<double> verticalVelocity;
    double worldHeight = 0.0;
};

enum class InputNormalization {
    // [yRel, velN, distN, gapN]: bird offset from the gap center in gap half-heights,
    // clamped velocity, saturating distance, and gap size relative to the world.
    GapRelative,
    // [birdY/h, topY/h, botY/h, dist/600]: raw heights scaled by world height.
    HeightScaled,
};

const char* toString(InputNormalization normalization);
bool parseInputNormalization(const std::string& name, InputNormalization& out);

struct DecisionConfig {
    bool useStochasticPolicy = false; // Sample against uniform(0,1) instead of threshold.
    double flapThreshold = 0.5;
};

PolicyInputs normalizeObservation(const Observation& observation, InputNormalization mode);

/**
 * Turns observations into flap decisions for a network.
 */
class DecisionPolicy {
public:
    static constexpr double EPSILON = 1e-6;
    static constexpr double VELOCITY_SCALE = 400.0;
    static constexpr double GAP_RELATIVE_DISTANCE_CAP = 200.0;
    static constexpr double HEIGHT_SCALED_DISTANCE_CAP = 600.0;

    DecisionPolicy() = default;
    DecisionPolicy(const DecisionConfig& config, InputNormalization normalization);

    bool shouldFlap(
        const FeedforwardPolicy& policy, const Observation& observation, std::mt19937& rng) const;

    // Applies the threshold or stochastic rule to a network output.
    bool decide(double output, std::mt19937& rng) const;

    const DecisionConfig& config() const { return config_; }
    InputNormalization normalization() const { return normalization_; }

private:
    DecisionConfig config_;
    InputNormalization normalization_ = InputNormalization::GapRelative;
};

} // namespace FlapEvo
