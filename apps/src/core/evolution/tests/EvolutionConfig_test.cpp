#include "core/evolution/EvolutionConfig.h"

#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace FlapEvo;

TEST(EvolutionConfigTest, PresetsDifferInCapabilities)
{
    const EvolutionConfig classic = makeClassicConfig();
    EXPECT_FALSE(classic.championEnabled);
    EXPECT_EQ(classic.selection, SelectionMode::RandomPair);
    EXPECT_EQ(classic.crossover, CrossoverMode::Average);
    EXPECT_EQ(classic.mutationSchedule, MutationSchedule::Fixed);
    EXPECT_EQ(classic.hiddenActivation, HiddenActivation::Sigmoid);
    EXPECT_EQ(classic.inputNormalization, InputNormalization::HeightScaled);

    const EvolutionConfig champion = makeChampionConfig();
    EXPECT_TRUE(champion.championEnabled);
    EXPECT_FALSE(champion.hallOfFameEnabled);
    EXPECT_EQ(champion.selection, SelectionMode::Tournament);
    EXPECT_EQ(champion.tournamentSize, 5);
    EXPECT_DOUBLE_EQ(champion.eliteFraction, 0.2);

    EXPECT_TRUE(makeHallOfFameConfig().hallOfFameEnabled);
}

TEST(EvolutionConfigTest, PresetLookupByName)
{
    EXPECT_TRUE(makePresetConfig("classic").has_value());
    EXPECT_TRUE(makePresetConfig("champion").has_value());
    EXPECT_TRUE(makePresetConfig("hallOfFame").has_value());
    EXPECT_FALSE(makePresetConfig("turbo").has_value());
}

TEST(EvolutionConfigTest, PartialJsonKeepsDefaults)
{
    const nlohmann::json json = {
        { "populationSize", 80 },
        { "mutation", { { "baseRate", 0.3 } } },
    };
    const EvolutionConfig config = json.get<EvolutionConfig>();

    EXPECT_EQ(config.populationSize, 80);
    EXPECT_DOUBLE_EQ(config.mutation.baseRate, 0.3);
    EXPECT_DOUBLE_EQ(config.mutation.baseStep, MutationConfig{}.baseStep);
    EXPECT_EQ(config.tournamentSize, EvolutionConfig{}.tournamentSize);
}

TEST(EvolutionConfigTest, PresetKeyIsOverriddenByExplicitKeys)
{
    const nlohmann::json json = { { "preset", "classic" }, { "populationSize", 12 } };
    const EvolutionConfig config = json.get<EvolutionConfig>();

    EXPECT_EQ(config.crossover, CrossoverMode::Average);
    EXPECT_EQ(config.populationSize, 12);
}

TEST(EvolutionConfigTest, JsonRoundTripPreservesEnums)
{
    EvolutionConfig original = makeClassicConfig();
    original.decision.useStochasticPolicy = true;

    const nlohmann::json json = original;
    EXPECT_EQ(json.at("selection"), "randomPair");
    EXPECT_EQ(json.at("hiddenActivation"), "sigmoid");

    const EvolutionConfig parsed = json.get<EvolutionConfig>();
    EXPECT_EQ(parsed.selection, original.selection);
    EXPECT_EQ(parsed.crossover, original.crossover);
    EXPECT_EQ(parsed.mutationSchedule, original.mutationSchedule);
    EXPECT_EQ(parsed.inputNormalization, original.inputNormalization);
    EXPECT_TRUE(parsed.decision.useStochasticPolicy);
}

TEST(EvolutionConfigTest, UnknownEnumNameThrows)
{
    const nlohmann::json json = { { "selection", "roulette" } };
    EXPECT_THROW(json.get<EvolutionConfig>(), std::invalid_argument);
}

TEST(EvolutionConfigTest, UnknownPresetThrows)
{
    const nlohmann::json json = { { "preset", "turbo" } };
    EXPECT_THROW(json.get<EvolutionConfig>(), std::invalid_argument);
}

TEST(EvolutionConfigTest, OutOfRangeKnobsThrow)
{
    const std::vector<std::pair<std::string, nlohmann::json>> rejected = {
        { "parameterLimit", { { "parameterLimit", -1.0 } } },
        { "parameterLimit", { { "parameterLimit", MAX_PARAMETER_LIMIT + 1.0 } } },
        { "eliteFraction", { { "eliteFraction", -0.1 } } },
        { "eliteFraction", { { "eliteFraction", 1.5 } } },
        { "baseRate", { { "mutation", { { "baseRate", 1.2 } } } } },
        { "midRate", { { "mutation", { { "midRate", -0.01 } } } } },
        { "lateRate", { { "mutation", { { "lateRate", 2.0 } } } } },
        { "minRate", { { "mutation", { { "minRate", -1.0 } } } } },
        { "fixedRate", { { "mutation", { { "fixedRate", 1.01 } } } } },
        { "baseStep", { { "mutation", { { "baseStep", -0.45 } } } } },
        { "midStep", { { "mutation", { { "midStep", -0.25 } } } } },
        { "lateStep", { { "mutation", { { "lateStep", -0.15 } } } } },
        { "minStep", { { "mutation", { { "minStep", -0.1 } } } } },
        { "fixedStep", { { "mutation", { { "fixedStep", MAX_MUTATION_STEP * 2 } } } } },
        { "flapThreshold", { { "decision", { { "flapThreshold", 1.5 } } } } },
    };

    for (const auto& [knob, json] : rejected) {
        SCOPED_TRACE(json.dump());
        try {
            json.get<EvolutionConfig>();
            ADD_FAILURE() << "Expected std::invalid_argument";
        }
        catch (const std::invalid_argument& e) {
            EXPECT_NE(std::string(e.what()).find(knob), std::string::npos) << e.what();
        }
    }
}

TEST(EvolutionConfigTest, PresetWithNegativeLimitThrows)
{
    const nlohmann::json json = { { "preset", "champion" }, { "parameterLimit", -1.0 } };
    EXPECT_THROW(json.get<EvolutionConfig>(), std::invalid_argument);
}

TEST(EvolutionConfigTest, RangeBoundsAreAccepted)
{
    const nlohmann::json json = {
        { "eliteFraction", 1.0 },
        { "parameterLimit", 0.0 },
        { "mutation", { { "baseRate", 0.0 }, { "fixedRate", 1.0 }, { "baseStep", 0.0 } } },
    };
    const EvolutionConfig config = json.get<EvolutionConfig>();

    EXPECT_DOUBLE_EQ(config.eliteFraction, 1.0);
    EXPECT_DOUBLE_EQ(config.parameterLimit, 0.0);
    EXPECT_DOUBLE_EQ(config.mutation.fixedRate, 1.0);
}

TEST(EvolutionConfigTest, ResetOutOfRangeKnobsRestoresDefaults)
{
    EvolutionConfig config = makeChampionConfig();
    config.parameterLimit = -1.0;
    config.eliteFraction = std::numeric_limits<double>::quiet_NaN();
    config.mutation.baseStep = -0.5;
    config.mutation.midRate = 0.3;

    const auto problems = resetOutOfRangeKnobs(config);

    EXPECT_EQ(problems.size(), 3u);
    EXPECT_DOUBLE_EQ(config.parameterLimit, EvolutionConfig{}.parameterLimit);
    EXPECT_DOUBLE_EQ(config.eliteFraction, EvolutionConfig{}.eliteFraction);
    EXPECT_DOUBLE_EQ(config.mutation.baseStep, MutationConfig{}.baseStep);
    EXPECT_DOUBLE_EQ(config.mutation.midRate, 0.3);
}

TEST(EvolutionConfigTest, PresetsAreInRange)
{
    for (const std::string preset : { "classic", "champion", "hallOfFame" }) {
        EvolutionConfig config = makePresetConfig(preset).value();
        EXPECT_TRUE(resetOutOfRangeKnobs(config).empty()) << preset;
    }
}
