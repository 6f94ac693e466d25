#include "DecisionPolicy.h"

#include "core/LoggingChannels.h"

#include <algorithm>

namespace FlapEvo {

const char* toString(InputNormalization normalization)
{
    switch (normalization) {
        case InputNormalization::GapRelative:
            return "gapRelative";
        case InputNormalization::HeightScaled:
            return "heightScaled";
    }
    return "";
}

bool parseInputNormalization(const std::string& name, InputNormalization& out)
{
    if (name == "gapRelative") {
        out = InputNormalization::GapRelative;
        return true;
    }
    if (name == "heightScaled") {
        out = InputNormalization::HeightScaled;
        return true;
    }
    return false;
}

PolicyInputs normalizeObservation(const Observation& observation, InputNormalization mode)
{
    constexpr double eps = DecisionPolicy::EPSILON;

    if (mode == InputNormalization::HeightScaled) {
        const double height = std::max(eps, observation.worldHeight);
        const double cap = DecisionPolicy::HEIGHT_SCALED_DISTANCE_CAP;
        return PolicyInputs{
            observation.birdY / height,
            observation.topY / height,
            observation.botY / height,
            std::clamp(observation.distanceToObstacle, 0.0, cap) / cap,
        };
    }

    const double gapCenter = (observation.topY + observation.botY) * 0.5;
    const double gapHalf = std::max(eps, (observation.topY - observation.botY) * 0.5);
    const double velocity = observation.verticalVelocity.value_or(0.0);
    const double cap = DecisionPolicy::GAP_RELATIVE_DISTANCE_CAP;

    return PolicyInputs{
        (observation.birdY - gapCenter) / gapHalf,
        std::clamp(velocity / DecisionPolicy::VELOCITY_SCALE, -1.0, 1.0),
        std::clamp(observation.distanceToObstacle, 0.0, cap) / cap,
        gapHalf / std::max(eps, observation.worldHeight),
    };
}

DecisionPolicy::DecisionPolicy(const DecisionConfig& config, InputNormalization normalization)
    : config_(config), normalization_(normalization)
{}

bool DecisionPolicy::shouldFlap(
    const FeedforwardPolicy& policy, const Observation& observation, std::mt19937& rng) const
{
    const PolicyInputs inputs = normalizeObservation(observation, normalization_);
    const double output = policy.predict(inputs);
    LOG_TRACE(
        Brain,
        "inputs=[{:.3f}, {:.3f}, {:.3f}, {:.3f}] output={:.4f}",
        inputs[0],
        inputs[1],
        inputs[2],
        inputs[3],
        output);
    return decide(output, rng);
}

bool DecisionPolicy::decide(double output, std::mt19937& rng) const
{
    if (config_.useStochasticPolicy) {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        return output > coin(rng);
    }
    return output > config_.flapThreshold;
}

} // namespace FlapEvo
