#pragma once

#include "WeightType.h"

#include <array>
#include <cstddef>
#include <random>
#include <span>
#include <string>

namespace FlapEvo {

enum class HiddenActivation { Sigmoid, Relu };

const char* toString(HiddenActivation activation);
bool parseHiddenActivation(const std::string& name, HiddenActivation& out);

/**
 * Weights and biases of the 4 -> 8 -> 1 flap network, stored as one flat array.
 *
 * Layout: input weights (hidden-major, 8 x 4), hidden biases (8), output weights (8),
 * output bias (1). Dimensions are fixed at compile time.
 */
struct NetworkParameters {
    static constexpr int INPUT_SIZE = 4;
    static constexpr int HIDDEN_SIZE = 8;
    static constexpr int OUTPUT_SIZE = 1;

    static constexpr int W_IH_SIZE = INPUT_SIZE * HIDDEN_SIZE;
    static constexpr int B_H_SIZE = HIDDEN_SIZE;
    static constexpr int W_HO_SIZE = HIDDEN_SIZE * OUTPUT_SIZE;
    static constexpr int B_O_SIZE = OUTPUT_SIZE;
    static constexpr int PARAMETER_COUNT = W_IH_SIZE + B_H_SIZE + W_HO_SIZE + B_O_SIZE;

    std::array<WeightType, PARAMETER_COUNT> values{};

    WeightType& inputWeight(int hidden, int input) { return values[hidden * INPUT_SIZE + input]; }
    WeightType inputWeight(int hidden, int input) const
    {
        return values[hidden * INPUT_SIZE + input];
    }

    WeightType& hiddenBias(int hidden) { return values[W_IH_SIZE + hidden]; }
    WeightType hiddenBias(int hidden) const { return values[W_IH_SIZE + hidden]; }

    WeightType& outputWeight(int hidden) { return values[W_IH_SIZE + B_H_SIZE + hidden]; }
    WeightType outputWeight(int hidden) const { return values[W_IH_SIZE + B_H_SIZE + hidden]; }

    WeightType& outputBias() { return values[W_IH_SIZE + B_H_SIZE + W_HO_SIZE]; }
    WeightType outputBias() const { return values[W_IH_SIZE + B_H_SIZE + W_HO_SIZE]; }

    bool operator==(const NetworkParameters& other) const = default;
};

using PolicyInputs = std::array<WeightType, NetworkParameters::INPUT_SIZE>;

/**
 * Fixed-topology feedforward network used as a flap controller.
 *
 * Hidden layer uses the configured activation; the output is always a logistic
 * sigmoid, so predictions lie in (0, 1). Copies are deep value copies.
 */
class FeedforwardPolicy {
public:
    // Sigmoid arguments are clamped to [-20, 20], which keeps results strictly inside
    // (0, 1) in double precision.
    static constexpr WeightType SIGMOID_CLAMP = 20.0;

    FeedforwardPolicy() = default;
    FeedforwardPolicy(const NetworkParameters& parameters, HiddenActivation activation);

    // Every weight and bias drawn uniformly from [-1, 1].
    static FeedforwardPolicy random(HiddenActivation activation, std::mt19937& rng);
    static FeedforwardPolicy zero(HiddenActivation activation);

    // Aborts unless exactly INPUT_SIZE inputs are given.
    WeightType predict(std::span<const WeightType> inputs) const;

    const NetworkParameters& parameters() const { return parameters_; }
    NetworkParameters& parameters() { return parameters_; }

    HiddenActivation activation() const { return activation_; }

    bool operator==(const FeedforwardPolicy& other) const = default;

private:
    NetworkParameters parameters_;
    HiddenActivation activation_ = HiddenActivation::Relu;
};

// Clamp every parameter into [-limit, limit].
void clipAll(NetworkParameters& parameters, WeightType limit);

} // namespace FlapEvo
