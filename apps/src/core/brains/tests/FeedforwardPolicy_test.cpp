#include "core/brains/FeedforwardPolicy.h"

#include <cmath>
#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace FlapEvo;

class FeedforwardPolicyTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    PolicyInputs randomInputs(double magnitude)
    {
        std::uniform_real_distribution<double> dist(-magnitude, magnitude);
        return PolicyInputs{ dist(rng), dist(rng), dist(rng), dist(rng) };
    }
};

TEST_F(FeedforwardPolicyTest, ParameterLayoutHasFortyNineValues)
{
    EXPECT_EQ(NetworkParameters::PARAMETER_COUNT, 49);

    NetworkParameters parameters;
    parameters.inputWeight(7, 3) = 1.0;
    parameters.hiddenBias(0) = 2.0;
    parameters.outputWeight(7) = 3.0;
    parameters.outputBias() = 4.0;

    EXPECT_EQ(parameters.values[31], 1.0);
    EXPECT_EQ(parameters.values[32], 2.0);
    EXPECT_EQ(parameters.values[47], 3.0);
    EXPECT_EQ(parameters.values[48], 4.0);
}

TEST_F(FeedforwardPolicyTest, OutputStaysInOpenUnitIntervalForRandomWeights)
{
    for (auto activation : { HiddenActivation::Sigmoid, HiddenActivation::Relu }) {
        for (int trial = 0; trial < 200; trial++) {
            const auto policy = FeedforwardPolicy::random(activation, rng);
            const double output = policy.predict(randomInputs(10.0));
            EXPECT_GT(output, 0.0);
            EXPECT_LT(output, 1.0);
        }
    }
}

TEST_F(FeedforwardPolicyTest, ExtremeWeightsStayStrictlyInsideUnitInterval)
{
    NetworkParameters parameters;
    parameters.values.fill(1000.0);
    const FeedforwardPolicy high(parameters, HiddenActivation::Relu);
    const double highOutput = high.predict(PolicyInputs{ 50.0, 50.0, 50.0, 50.0 });
    EXPECT_LT(highOutput, 1.0);

    parameters.values.fill(-1000.0);
    parameters.outputBias() = -1000.0;
    const FeedforwardPolicy low(parameters, HiddenActivation::Sigmoid);
    const double lowOutput = low.predict(PolicyInputs{ 50.0, 50.0, 50.0, 50.0 });
    EXPECT_GT(lowOutput, 0.0);
}

TEST_F(FeedforwardPolicyTest, ZeroPolicyPredictsOneHalf)
{
    const auto policy = FeedforwardPolicy::zero(HiddenActivation::Relu);
    EXPECT_DOUBLE_EQ(policy.predict(PolicyInputs{ 0.3, -0.2, 0.9, 0.1 }), 0.5);
}

TEST_F(FeedforwardPolicyTest, OutputBiasAloneSetsPrediction)
{
    NetworkParameters parameters;
    parameters.outputBias() = 2.0;
    const FeedforwardPolicy policy(parameters, HiddenActivation::Sigmoid);

    const double expected = 1.0 / (1.0 + std::exp(-2.0));
    EXPECT_NEAR(policy.predict(PolicyInputs{ 1.0, 2.0, 3.0, 4.0 }), expected, 1e-12);
}

TEST_F(FeedforwardPolicyTest, ReluHiddenLayerIgnoresNegativeActivations)
{
    NetworkParameters parameters;
    parameters.inputWeight(0, 0) = -1.0;
    parameters.outputWeight(0) = 5.0;
    const FeedforwardPolicy policy(parameters, HiddenActivation::Relu);

    // Hidden unit 0 is negative for positive input, so ReLU zeroes it.
    EXPECT_DOUBLE_EQ(policy.predict(PolicyInputs{ 1.0, 0.0, 0.0, 0.0 }), 0.5);
    // Negative input makes it positive and drives the output up.
    EXPECT_GT(policy.predict(PolicyInputs{ -1.0, 0.0, 0.0, 0.0 }), 0.99);
}

TEST_F(FeedforwardPolicyTest, CopyIsIndependentOfOriginal)
{
    const auto original = FeedforwardPolicy::random(HiddenActivation::Relu, rng);
    FeedforwardPolicy copy = original;
    ASSERT_EQ(copy, original);

    copy.parameters().values[0] += 1.0;

    EXPECT_NE(copy, original);
    const PolicyInputs inputs{ 1.0, 0.0, 0.0, 0.0 };
    EXPECT_EQ(original.predict(inputs), FeedforwardPolicy(original).predict(inputs));
}

TEST_F(FeedforwardPolicyTest, PredictIsDeterministic)
{
    const auto policy = FeedforwardPolicy::random(HiddenActivation::Sigmoid, rng);
    const PolicyInputs inputs = randomInputs(1.0);
    EXPECT_EQ(policy.predict(inputs), policy.predict(inputs));
}

TEST_F(FeedforwardPolicyTest, RandomWeightsAreWithinUnitRange)
{
    const auto policy = FeedforwardPolicy::random(HiddenActivation::Relu, rng);
    for (double value : policy.parameters().values) {
        EXPECT_GE(value, -1.0);
        EXPECT_LE(value, 1.0);
    }
}

TEST_F(FeedforwardPolicyTest, ClipAllClampsEveryParameter)
{
    NetworkParameters parameters;
    for (int i = 0; i < NetworkParameters::PARAMETER_COUNT; i++) {
        parameters.values[i] = (i % 2 == 0 ? 1.0 : -1.0) * i;
    }

    clipAll(parameters, 6.0);

    for (double value : parameters.values) {
        EXPECT_GE(value, -6.0);
        EXPECT_LE(value, 6.0);
    }
    EXPECT_EQ(parameters.values[4], 4.0);
    EXPECT_EQ(parameters.values[47], -6.0);
}

TEST_F(FeedforwardPolicyTest, ActivationNamesParse)
{
    HiddenActivation activation = HiddenActivation::Relu;
    EXPECT_TRUE(parseHiddenActivation("sigmoid", activation));
    EXPECT_EQ(activation, HiddenActivation::Sigmoid);
    EXPECT_TRUE(parseHiddenActivation(toString(HiddenActivation::Relu), activation));
    EXPECT_EQ(activation, HiddenActivation::Relu);
    EXPECT_FALSE(parseHiddenActivation("tanh", activation));
}

TEST_F(FeedforwardPolicyTest, WrongInputCountAborts)
{
    const auto policy = FeedforwardPolicy::zero(HiddenActivation::Relu);
    const std::vector<WeightType> tooFew{ 0.1, 0.2, 0.3 };
    EXPECT_DEATH(policy.predict(tooFew), "");
}
