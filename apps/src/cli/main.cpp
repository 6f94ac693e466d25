#include "core/ColorNames.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/Result.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/EvolutionEngine.h"
#include "core/evolution/PopulationStore.h"

#include <args.hxx>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace FlapEvo;

namespace {

constexpr const char* kEvolutionConfigFile = "evolution.json";

std::string getExamplesHelp()
{
    std::string examples = "Examples:\n\n";
    examples += "  flapevo-cli init --population 50 --preset champion --out pop.json\n";
    examples += "  flapevo-cli inspect pop.json\n";
    examples += "  flapevo-cli decide pop.json --index 0 --bird-y 300 --top-y 380 --bot-y 240 "
                "--dist 120 --vel-y -50 --height 640\n";
    examples += "  flapevo-cli evolve pop.json --results episode.json\n";
    examples += "  flapevo-cli config --preset classic\n";
    examples += "  flapevo-cli -C evolution:debug evolve pop.json --results episode.json\n";
    examples += "\nPresets: classic, champion, hallOfFame\n";
    examples += "\nEpisode results file:\n";
    examples += "  [ { \"index\": 0, \"score\": 3, \"distance\": 812.5 }, ... ]\n";
    return examples;
}

// Preset if named, otherwise evolution.json from the config search path, otherwise the
// champion preset.
Result<EvolutionConfig, std::string> resolveConfig(const std::optional<std::string>& preset)
{
    if (preset.has_value()) {
        auto config = makePresetConfig(preset.value());
        if (!config.has_value()) {
            return Result<EvolutionConfig, std::string>::error(
                "Unknown preset '" + preset.value() + "' (classic, champion, hallOfFame)");
        }
        return Result<EvolutionConfig, std::string>::okay(config.value());
    }

    if (!ConfigLoader::findConfigFile(kEvolutionConfigFile).has_value()) {
        SLOG_DEBUG("No {} found, using champion preset", kEvolutionConfigFile);
        return Result<EvolutionConfig, std::string>::okay(makeChampionConfig());
    }
    return ConfigLoader::load<EvolutionConfig>(kEvolutionConfigFile);
}

// Engine built from a saved document's own configuration, then restored.
Result<std::unique_ptr<EvolutionEngine>, std::string> loadEngine(const std::string& path)
{
    using R = Result<std::unique_ptr<EvolutionEngine>, std::string>;

    auto saved = PopulationStore::load(path);
    if (saved.isError()) {
        return R::error(saved.errorValue());
    }

    return R::okay(PopulationStore::resume(std::move(saved.value())));
}

std::string formatColor(uint32_t color)
{
    char buffer[16];
    std::snprintf(
        buffer,
        sizeof(buffer),
        "#%02X%02X%02X",
        ColorNames::getR(color),
        ColorNames::getG(color),
        ColorNames::getB(color));
    return buffer;
}

int runInit(
    const std::optional<std::string>& preset,
    std::optional<int> population,
    std::optional<uint32_t> seed,
    const std::string& outPath)
{
    auto configResult = resolveConfig(preset);
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }

    EvolutionConfig config = configResult.value();
    if (population.has_value()) {
        config.populationSize = population.value();
    }
    if (seed.has_value()) {
        config.seed = seed.value();
    }

    EvolutionEngine engine(config);
    auto saveResult = PopulationStore::save(engine, outPath);
    if (saveResult.isError()) {
        std::cerr << "Error: " << saveResult.errorValue() << std::endl;
        return 1;
    }

    std::cout << "Created generation " << engine.generation() << " with "
              << engine.populationSize() << " genomes (seed " << engine.seed() << ") in "
              << outPath << std::endl;
    return 0;
}

int runInspect(const std::string& path)
{
    auto engineResult = loadEngine(path);
    if (engineResult.isError()) {
        std::cerr << "Error: " << engineResult.errorValue() << std::endl;
        return 1;
    }
    const EvolutionEngine& engine = *engineResult.value();
    const EvolutionConfig& config = engine.config();

    std::cout << "Generation:      " << engine.generation() << "\n";
    std::cout << "Population:      " << engine.populationSize() << "\n";
    std::cout << "Selection:       " << toString(config.selection) << "\n";
    std::cout << "Crossover:       " << toString(config.crossover) << "\n";
    std::cout << "Mutation:        " << toString(config.mutationSchedule) << "\n";
    std::cout << "Hidden layer:    " << toString(config.hiddenActivation) << "\n";
    std::cout << "Normalization:   " << toString(config.inputNormalization) << "\n";

    if (engine.champion().has_value()) {
        std::cout << "Champion:        score " << engine.champion()->score << ", fitness "
                  << std::fixed << std::setprecision(1) << engine.champion()->fitness << "\n";
    }
    else {
        std::cout << "Champion:        none\n";
    }

    std::cout << "Hall of fame:    " << engine.hallOfFame().size() << "/"
              << engine.hallOfFame().capacity() << "\n";
    for (size_t i = 0; i < engine.hallOfFame().size(); i++) {
        const auto& entry = engine.hallOfFame().entries()[i];
        std::cout << "  [" << i << "] score " << entry.score << ", fitness " << std::fixed
                  << std::setprecision(1) << entry.fitness << "\n";
    }

    std::cout << "Genomes:\n";
    const auto snapshot = engine.currentPopulationSnapshot();
    for (size_t i = 0; i < snapshot.size(); i++) {
        std::cout << "  [" << i << "] color " << formatColor(snapshot[i].color) << ", output bias "
                  << std::fixed << std::setprecision(3)
                  << snapshot[i].policy->parameters().outputBias() << "\n";
    }
    std::cout.flush();
    return 0;
}

int runDecide(const std::string& path, int index, const Observation& observation)
{
    auto engineResult = loadEngine(path);
    if (engineResult.isError()) {
        std::cerr << "Error: " << engineResult.errorValue() << std::endl;
        return 1;
    }
    const EvolutionEngine& engine = *engineResult.value();

    if (index < 0 || index >= engine.populationSize()) {
        std::cerr << "Error: index " << index << " out of range [0, " << engine.populationSize()
                  << ")" << std::endl;
        return 1;
    }

    const FeedforwardPolicy& policy = engine.genomes()[index].policy;
    const PolicyInputs inputs =
        normalizeObservation(observation, engine.config().inputNormalization);
    const double output = policy.predict(inputs);

    std::mt19937 rng(engine.seed());
    const bool flap = engine.decisionPolicy().decide(output, rng);

    nlohmann::json result{
        { "index", index },
        { "inputs", inputs },
        { "output", output },
        { "flap", flap },
    };
    std::cout << result.dump(2) << std::endl;
    return 0;
}

int runEvolve(
    const std::string& path, const std::string& resultsPath, const std::string& outPath)
{
    auto engineResult = loadEngine(path);
    if (engineResult.isError()) {
        std::cerr << "Error: " << engineResult.errorValue() << std::endl;
        return 1;
    }
    EvolutionEngine& engine = *engineResult.value();

    std::ifstream resultsFile(resultsPath);
    if (!resultsFile.is_open()) {
        std::cerr << "Error: cannot open results file " << resultsPath << std::endl;
        return 1;
    }

    nlohmann::json results;
    try {
        results = nlohmann::json::parse(resultsFile);
        if (!results.is_array()) {
            std::cerr << "Error: results file must hold a JSON array" << std::endl;
            return 1;
        }

        engine.resetRunState();
        for (const auto& outcome : results) {
            const int index = outcome.at("index").get<int>();
            const int score = outcome.value("score", 0);
            const double distance = outcome.value("distance", 0.0);
            if (index < 0 || index >= engine.populationSize()) {
                SLOG_WARN("Ignoring result for out-of-range index {}", index);
                continue;
            }

            engine.tickAlive(index, distance);
            for (int i = 0; i < score; i++) {
                engine.addScore(index);
            }
            engine.kill(index);
        }
    }
    catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: malformed results file " << resultsPath << ": " << e.what()
                  << std::endl;
        return 1;
    }

    // Individuals without a reported outcome died at the start line.
    for (int i = 0; i < engine.populationSize(); i++) {
        engine.kill(i);
    }

    const GenerationSummary summary = engine.evolve();

    auto saveResult = PopulationStore::save(engine, outPath);
    if (saveResult.isError()) {
        std::cerr << "Error: " << saveResult.errorValue() << std::endl;
        return 1;
    }

    nlohmann::json report{
        { "finishedGeneration", summary.finishedGeneration },
        { "generation", summary.generation },
        { "bestScore", summary.bestScore },
        { "bestFitness", summary.bestFitness },
        { "championScore", summary.championScore.has_value()
              ? nlohmann::json(summary.championScore.value())
              : nlohmann::json(nullptr) },
        { "mutationRate", summary.mutationRate },
        { "mutationStep", summary.mutationStep },
        { "eliteCount", summary.eliteCount },
        { "hallOfFameSize", summary.hallOfFameSize },
    };
    std::cout << report.dump(2) << std::endl;
    return 0;
}

int runConfig(const std::optional<std::string>& preset)
{
    auto configResult = resolveConfig(preset);
    if (configResult.isError()) {
        std::cerr << "Error: " << configResult.errorValue() << std::endl;
        return 1;
    }
    std::cout << nlohmann::json(configResult.value()).dump(2) << std::endl;
    return 0;
}

template <typename T>
std::optional<T> optionalValue(args::ValueFlag<T>& flag)
{
    if (!flag) {
        return std::nullopt;
    }
    return args::get(flag);
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "FlapEvo CLI",
        "Offline driver for the flap policy evolution core.\n\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for evolution.json", { "config-dir" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "file",
        "Logging config file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> channels(
        parser,
        "spec",
        "Channel log levels, e.g. 'evolution:debug,*:warn'",
        { 'C', "channels" });

    args::ValueFlag<std::string> preset(
        parser, "preset", "Preset: classic, champion, hallOfFame", { "preset" });
    args::ValueFlag<int> population(
        parser, "count", "init: population size", { 'n', "population" });
    args::ValueFlag<uint32_t> seed(
        parser, "seed", "init: random seed (0 = nondeterministic)", { "seed" });
    args::ValueFlag<std::string> out(
        parser, "file", "init/evolve: output population file", { 'o', "out" });
    args::ValueFlag<std::string> results(
        parser, "file", "evolve: JSON array of episode outcomes", { "results" });

    args::ValueFlag<int> index(parser, "index", "decide: genome index", { 'i', "index" });
    args::ValueFlag<double> birdY(parser, "y", "decide: bird height", { "bird-y" });
    args::ValueFlag<double> topY(parser, "y", "decide: upper gap edge", { "top-y" });
    args::ValueFlag<double> botY(parser, "y", "decide: lower gap edge", { "bot-y" });
    args::ValueFlag<double> dist(parser, "px", "decide: distance to next obstacle", { "dist" });
    args::ValueFlag<double> velY(parser, "px/s", "decide: vertical velocity", { "vel-y" });
    args::ValueFlag<double> height(parser, "px", "decide: world height", { "height" });

    args::Positional<std::string> command(
        parser, "command", "Command: init, inspect, decide, evolve, config");
    args::Positional<std::string> file(parser, "file", "Population file");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig), "cli");
    if (channels) {
        LoggingChannels::configureFromString(args::get(channels));
    }
    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    if (!command) {
        std::cerr << "Error: command is required (init, inspect, decide, evolve, config)\n\n";
        std::cerr << parser;
        return 1;
    }

    const std::string commandName = args::get(command);

    if (commandName == "config") {
        return runConfig(optionalValue(preset));
    }

    if (commandName == "init") {
        const std::string outPath = out ? args::get(out) : (file ? args::get(file) : "");
        if (outPath.empty()) {
            std::cerr << "Error: init requires --out FILE\n";
            return 1;
        }
        return runInit(
            optionalValue(preset), optionalValue(population), optionalValue(seed), outPath);
    }

    if (!file) {
        std::cerr << "Error: " << commandName << " requires a population file\n\n";
        std::cerr << parser;
        return 1;
    }
    const std::string path = args::get(file);

    if (commandName == "inspect") {
        return runInspect(path);
    }

    if (commandName == "decide") {
        if (!index || !birdY || !topY || !botY || !dist || !height) {
            std::cerr << "Error: decide requires --index, --bird-y, --top-y, --bot-y, --dist "
                         "and --height\n";
            return 1;
        }
        Observation observation{
            .birdY = args::get(birdY),
            .topY = args::get(topY),
            .botY = args::get(botY),
            .distanceToObstacle = args::get(dist),
            .verticalVelocity = optionalValue(velY),
            .worldHeight = args::get(height),
        };
        return runDecide(path, args::get(index), observation);
    }

    if (commandName == "evolve") {
        if (!results) {
            std::cerr << "Error: evolve requires --results FILE\n";
            return 1;
        }
        return runEvolve(path, args::get(results), out ? args::get(out) : path);
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << parser;
    return 1;
}
