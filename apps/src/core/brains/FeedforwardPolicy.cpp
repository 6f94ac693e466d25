#include "FeedforwardPolicy.h"

#include "core/Assert.h"

#include <algorithm>
#include <cmath>

namespace FlapEvo {

namespace {

WeightType sigmoid(WeightType x)
{
    const WeightType z =
        std::clamp(x, -FeedforwardPolicy::SIGMOID_CLAMP, FeedforwardPolicy::SIGMOID_CLAMP);
    return 1.0 / (1.0 + std::exp(-z));
}

WeightType relu(WeightType x)
{
    return std::max<WeightType>(0.0, x);
}

} // namespace

const char* toString(HiddenActivation activation)
{
    switch (activation) {
        case HiddenActivation::Sigmoid:
            return "sigmoid";
        case HiddenActivation::Relu:
            return "relu";
    }
    return "";
}

bool parseHiddenActivation(const std::string& name, HiddenActivation& out)
{
    if (name == "sigmoid") {
        out = HiddenActivation::Sigmoid;
        return true;
    }
    if (name == "relu") {
        out = HiddenActivation::Relu;
        return true;
    }
    return false;
}

FeedforwardPolicy::FeedforwardPolicy(
    const NetworkParameters& parameters, HiddenActivation activation)
    : parameters_(parameters), activation_(activation)
{}

FeedforwardPolicy FeedforwardPolicy::random(HiddenActivation activation, std::mt19937& rng)
{
    std::uniform_real_distribution<WeightType> dist(-1.0, 1.0);

    NetworkParameters parameters;
    for (auto& value : parameters.values) {
        value = dist(rng);
    }
    return FeedforwardPolicy(parameters, activation);
}

FeedforwardPolicy FeedforwardPolicy::zero(HiddenActivation activation)
{
    return FeedforwardPolicy(NetworkParameters{}, activation);
}

WeightType FeedforwardPolicy::predict(std::span<const WeightType> inputs) const
{
    FLAPEVO_ASSERT(
        inputs.size() == static_cast<size_t>(NetworkParameters::INPUT_SIZE),
        "FeedforwardPolicy::predict requires exactly 4 inputs");

    // Hidden layer: h = act(W_ih @ input + b_h).
    std::array<WeightType, NetworkParameters::HIDDEN_SIZE> hidden{};
    for (int h = 0; h < NetworkParameters::HIDDEN_SIZE; h++) {
        WeightType sum = parameters_.hiddenBias(h);
        for (int i = 0; i < NetworkParameters::INPUT_SIZE; i++) {
            sum += inputs[i] * parameters_.inputWeight(h, i);
        }
        hidden[h] = activation_ == HiddenActivation::Relu ? relu(sum) : sigmoid(sum);
    }

    // Output layer: o = sigmoid(W_ho @ hidden + b_o).
    WeightType out = parameters_.outputBias();
    for (int h = 0; h < NetworkParameters::HIDDEN_SIZE; h++) {
        out += hidden[h] * parameters_.outputWeight(h);
    }
    return sigmoid(out);
}

void clipAll(NetworkParameters& parameters, WeightType limit)
{
    for (auto& value : parameters.values) {
        value = std::clamp(value, -limit, limit);
    }
}

} // namespace FlapEvo
