#include "core/ConfigLoader.h"
#include "core/evolution/EvolutionConfig.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace FlapEvo;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = std::filesystem::temp_directory_path()
            / ("flapevo_config_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir_);
        ConfigLoader::setConfigDir(dir_.string());
    }

    void TearDown() override
    {
        ConfigLoader::clearConfigDir();
        std::filesystem::remove_all(dir_);
    }

    void writeFile(const std::string& name, const std::string& content)
    {
        std::ofstream(dir_ / name) << content;
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigLoaderTest, ExplicitDirectoryIsSearchedFirst)
{
    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), dir_);
}

TEST_F(ConfigLoaderTest, LoadsTypedConfig)
{
    writeFile("test_evolution.json", R"({ "populationSize": 33, "selection": "randomPair" })");

    auto result = ConfigLoader::load<EvolutionConfig>("test_evolution.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().populationSize, 33);
    EXPECT_EQ(result.value().selection, SelectionMode::RandomPair);
}

TEST_F(ConfigLoaderTest, LocalFileReplacesBaseFile)
{
    writeFile("test_evolution.json", R"({ "populationSize": 33 })");
    writeFile("test_evolution.json.local", R"({ "tournamentSize": 9 })");

    auto result = ConfigLoader::load<EvolutionConfig>("test_evolution.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().tournamentSize, 9);
    EXPECT_EQ(result.value().populationSize, EvolutionConfig{}.populationSize);
}

TEST_F(ConfigLoaderTest, MissingFileIsAnError)
{
    auto result = ConfigLoader::load<EvolutionConfig>("flapevo_no_such_file.json");
    EXPECT_TRUE(result.isError());
}

TEST_F(ConfigLoaderTest, ParseErrorIsAnError)
{
    writeFile("test_broken.json", "{ \"populationSize\": ");

    auto result = ConfigLoader::load<EvolutionConfig>("test_broken.json");
    EXPECT_TRUE(result.isError());
}

TEST_F(ConfigLoaderTest, InvalidEnumIsAnError)
{
    writeFile("test_enum.json", R"({ "crossover": "twoPoint" })");

    auto result = ConfigLoader::load<EvolutionConfig>("test_enum.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("twoPoint"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadFromPathSkipsSearch)
{
    writeFile("direct.json", R"({ "preset": "classic" })");

    auto result = ConfigLoader::loadFromPath<EvolutionConfig>(dir_ / "direct.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    EXPECT_EQ(result.value().crossover, CrossoverMode::Average);
}
