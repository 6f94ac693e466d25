#include "core/evolution/Crossover.h"

#include <gtest/gtest.h>

using namespace FlapEvo;

class CrossoverTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    FeedforwardPolicy constant(double value)
    {
        NetworkParameters parameters;
        parameters.values.fill(value);
        return FeedforwardPolicy(parameters, HiddenActivation::Relu);
    }
};

TEST_F(CrossoverTest, SelfCrossoverReturnsSameParameters)
{
    const auto parent = FeedforwardPolicy::random(HiddenActivation::Relu, rng);

    EXPECT_EQ(crossoverUniform(parent, parent, rng), parent);
    EXPECT_EQ(crossoverAverage(parent, parent), parent);
}

TEST_F(CrossoverTest, UniformTakesEachValueFromAParent)
{
    const auto a = FeedforwardPolicy::random(HiddenActivation::Relu, rng);
    const auto b = FeedforwardPolicy::random(HiddenActivation::Relu, rng);

    const auto child = crossoverUniform(a, b, rng);

    int fromA = 0;
    for (int i = 0; i < NetworkParameters::PARAMETER_COUNT; i++) {
        const double value = child.parameters().values[i];
        const bool matchesA = value == a.parameters().values[i];
        const bool matchesB = value == b.parameters().values[i];
        EXPECT_TRUE(matchesA || matchesB) << "parameter " << i;
        if (matchesA) {
            fromA++;
        }
    }

    // Both parents contribute.
    EXPECT_GT(fromA, 0);
    EXPECT_LT(fromA, NetworkParameters::PARAMETER_COUNT);
}

TEST_F(CrossoverTest, AverageIsMidpoint)
{
    const auto child = crossoverAverage(constant(1.0), constant(-3.0));
    for (double value : child.parameters().values) {
        EXPECT_DOUBLE_EQ(value, -1.0);
    }
}

TEST_F(CrossoverTest, ClipLimitAppliesToChild)
{
    const auto child = crossoverAverage(constant(10.0), constant(20.0), 6.0);
    for (double value : child.parameters().values) {
        EXPECT_DOUBLE_EQ(value, 6.0);
    }

    const auto uniformChild = crossoverUniform(constant(-9.0), constant(-7.0), rng, 6.0);
    for (double value : uniformChild.parameters().values) {
        EXPECT_DOUBLE_EQ(value, -6.0);
    }
}

TEST_F(CrossoverTest, ChildKeepsFirstParentActivation)
{
    const auto a = FeedforwardPolicy::zero(HiddenActivation::Sigmoid);
    const auto b = FeedforwardPolicy::zero(HiddenActivation::Relu);

    EXPECT_EQ(crossover(CrossoverMode::Uniform, a, b, rng).activation(), HiddenActivation::Sigmoid);
    EXPECT_EQ(crossover(CrossoverMode::Average, a, b, rng).activation(), HiddenActivation::Sigmoid);
}
