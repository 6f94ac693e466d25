#include "core/evolution/EvolutionEngine.h"
#include "core/evolution/PopulationStore.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <utility>

using namespace FlapEvo;

class PopulationStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        tempDir_ = std::filesystem::temp_directory_path()
            / ("flapevo_store_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    EvolutionEngine evolvedEngine(EvolutionConfig config)
    {
        config.populationSize = 12;
        config.seed = 77;
        EvolutionEngine engine(config);
        for (int gen = 0; gen < 2; gen++) {
            engine.resetRunState();
            for (int i = 0; i < engine.populationSize(); i++) {
                engine.tickAlive(i, 5.0 * i);
                if (i % 3 == 0) {
                    engine.addScore(i);
                }
                engine.kill(i);
            }
            engine.evolve();
        }
        return engine;
    }

    std::filesystem::path tempDir_;
};

TEST_F(PopulationStoreTest, SaveThenLoadRestoresIdenticalPredictions)
{
    const EvolutionEngine original = evolvedEngine(makeHallOfFameConfig());
    const auto path = tempDir_ / "population.json";

    ASSERT_TRUE(PopulationStore::save(original, path).isValue());

    EvolutionEngine restored(makeHallOfFameConfig());
    auto result = PopulationStore::load(restored, path);
    ASSERT_TRUE(result.isValue()) << result.errorValue();

    EXPECT_EQ(restored.generation(), original.generation());
    ASSERT_EQ(restored.populationSize(), original.populationSize());
    EXPECT_TRUE(restored.champion() == original.champion());
    EXPECT_TRUE(restored.hallOfFame().entries() == original.hallOfFame().entries());

    const PolicyInputs inputs{ 0.2, -0.4, 0.7, 0.1 };
    for (int i = 0; i < original.populationSize(); i++) {
        EXPECT_EQ(
            restored.genomes()[i].policy.predict(inputs),
            original.genomes()[i].policy.predict(inputs));
        EXPECT_EQ(restored.genomes()[i].color, original.genomes()[i].color);
    }
}

TEST_F(PopulationStoreTest, LoadCarriesSavedConfigAndActivation)
{
    const EvolutionEngine original = evolvedEngine(makeClassicConfig());
    const auto path = tempDir_ / "classic.json";
    ASSERT_TRUE(PopulationStore::save(original, path).isValue());

    auto saved = PopulationStore::load(path);
    ASSERT_TRUE(saved.isValue()) << saved.errorValue();

    EXPECT_EQ(saved.value().config.crossover, CrossoverMode::Average);
    EXPECT_FALSE(saved.value().champion.has_value());
    for (const auto& genome : saved.value().genomes) {
        EXPECT_EQ(genome.policy.activation(), HiddenActivation::Sigmoid);
        EXPECT_TRUE(genome.alive);
    }
}

TEST_F(PopulationStoreTest, ResumeKeepsStoredSeedAcrossRuns)
{
    const EvolutionEngine original = evolvedEngine(makeChampionConfig());
    ASSERT_EQ(original.generation(), 3);
    const auto path = tempDir_ / "resume.json";
    ASSERT_TRUE(PopulationStore::save(original, path).isValue());

    // Two load, evolve, save cycles, the way the CLI drives them.
    for (int run = 0; run < 2; run++) {
        auto saved = PopulationStore::load(path);
        ASSERT_TRUE(saved.isValue()) << saved.errorValue();
        const int generation = saved.value().generation;

        auto engine = PopulationStore::resume(std::move(saved.value()));
        EXPECT_EQ(engine->config().seed, 77u);
        EXPECT_EQ(engine->seed(), 77u + static_cast<uint32_t>(generation));
        EXPECT_EQ(engine->generation(), generation);
        EXPECT_EQ(engine->populationSize(), 12);

        for (int i = 0; i < engine->populationSize(); i++) {
            engine->kill(i);
        }
        engine->evolve();
        ASSERT_TRUE(PopulationStore::save(*engine, path).isValue());
    }

    auto last = PopulationStore::load(path);
    ASSERT_TRUE(last.isValue()) << last.errorValue();
    EXPECT_EQ(last.value().config.seed, 77u);
    EXPECT_EQ(last.value().generation, 5);
}

TEST_F(PopulationStoreTest, ResumeSeedNeverWrapsToRandom)
{
    EXPECT_EQ(PopulationStore::resumeSeed(0, 9), 0u);
    EXPECT_EQ(PopulationStore::resumeSeed(100, 3), 103u);
    EXPECT_EQ(PopulationStore::resumeSeed(std::numeric_limits<uint32_t>::max(), 1), 1u);
}

TEST_F(PopulationStoreTest, WrongParameterCountIsAnError)
{
    const EvolutionEngine original = evolvedEngine(makeChampionConfig());
    nlohmann::json json = PopulationStore::toJson(PopulationStore::capture(original));
    json["population"][3]["parameters"].erase(0);

    auto result = PopulationStore::fromJson(json);
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("population[3]"), std::string::npos);
}

TEST_F(PopulationStoreTest, TooSmallPopulationIsAnError)
{
    const EvolutionEngine original = evolvedEngine(makeChampionConfig());
    nlohmann::json json = PopulationStore::toJson(PopulationStore::capture(original));
    json["population"] = nlohmann::json::array({ json["population"][0] });

    EXPECT_TRUE(PopulationStore::fromJson(json).isError());
}

TEST_F(PopulationStoreTest, UnsupportedVersionIsAnError)
{
    const EvolutionEngine original = evolvedEngine(makeChampionConfig());
    nlohmann::json json = PopulationStore::toJson(PopulationStore::capture(original));
    json["version"] = PopulationStore::FORMAT_VERSION + 1;

    EXPECT_TRUE(PopulationStore::fromJson(json).isError());
}

TEST_F(PopulationStoreTest, MissingFileIsAnError)
{
    auto result = PopulationStore::load(tempDir_ / "does_not_exist.json");
    EXPECT_TRUE(result.isError());
}

TEST_F(PopulationStoreTest, MalformedJsonIsAnError)
{
    const auto path = tempDir_ / "broken.json";
    std::ofstream(path) << "{ \"version\": 1, ";

    EvolutionEngine engine;
    const int generationBefore = engine.generation();
    auto result = PopulationStore::load(engine, path);

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(engine.generation(), generationBefore);
}
