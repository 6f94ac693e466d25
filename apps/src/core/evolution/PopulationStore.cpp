#include "PopulationStore.h"

#include "EvolutionEngine.h"
#include "core/LoggingChannels.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

namespace FlapEvo {

namespace {

nlohmann::json parametersToJson(const NetworkParameters& parameters)
{
    return nlohmann::json(parameters.values);
}

Result<NetworkParameters, std::string> parametersFromJson(
    const nlohmann::json& json, const std::string& where)
{
    if (!json.is_array()) {
        return Result<NetworkParameters, std::string>::error(
            where + ": parameters must be an array");
    }
    if (json.size() != static_cast<size_t>(NetworkParameters::PARAMETER_COUNT)) {
        return Result<NetworkParameters, std::string>::error(
            where + ": expected " + std::to_string(NetworkParameters::PARAMETER_COUNT)
            + " parameters, got " + std::to_string(json.size()));
    }

    NetworkParameters parameters;
    for (size_t i = 0; i < json.size(); i++) {
        if (!json[i].is_number()) {
            return Result<NetworkParameters, std::string>::error(
                where + ": parameter " + std::to_string(i) + " is not a number");
        }
        parameters.values[i] = json[i].get<WeightType>();
    }
    return Result<NetworkParameters, std::string>::okay(parameters);
}

nlohmann::json retainedToJson(const RetainedPolicy& retained)
{
    return nlohmann::json{
        { "score", retained.score },
        { "fitness", retained.fitness },
        { "parameters", parametersToJson(retained.policy.parameters()) },
    };
}

Result<RetainedPolicy, std::string> retainedFromJson(
    const nlohmann::json& json, HiddenActivation activation, const std::string& where)
{
    auto parameters = parametersFromJson(json.at("parameters"), where);
    if (parameters.isError()) {
        return Result<RetainedPolicy, std::string>::error(parameters.errorValue());
    }
    return Result<RetainedPolicy, std::string>::okay(
        RetainedPolicy{
            .policy = FeedforwardPolicy(parameters.value(), activation),
            .score = json.at("score").get<int>(),
            .fitness = json.at("fitness").get<double>(),
        });
}

} // namespace

SavedPopulation PopulationStore::capture(const EvolutionEngine& engine)
{
    SavedPopulation saved;
    saved.config = engine.config();
    saved.generation = engine.generation();
    saved.genomes = engine.genomes();
    saved.champion = engine.champion();
    saved.hallOfFame = engine.hallOfFame().entries();
    return saved;
}

void PopulationStore::restoreInto(EvolutionEngine& engine, SavedPopulation saved)
{
    engine.restore(
        saved.generation,
        std::move(saved.genomes),
        std::move(saved.champion),
        std::move(saved.hallOfFame));
}

uint32_t PopulationStore::resumeSeed(uint32_t storedSeed, int generation)
{
    if (storedSeed == 0) {
        return 0;
    }
    const uint32_t seed = storedSeed + static_cast<uint32_t>(generation);
    // 0 would mean "seed from std::random_device".
    return seed != 0 ? seed : 1;
}

std::unique_ptr<EvolutionEngine> PopulationStore::resume(SavedPopulation saved)
{
    EvolutionConfig config = saved.config;
    config.populationSize = static_cast<int>(saved.genomes.size());

    auto engine =
        std::make_unique<EvolutionEngine>(config, resumeSeed(config.seed, saved.generation));
    restoreInto(*engine, std::move(saved));
    return engine;
}

nlohmann::json PopulationStore::toJson(const SavedPopulation& saved)
{
    nlohmann::json population = nlohmann::json::array();
    for (const auto& genome : saved.genomes) {
        population.push_back(
            nlohmann::json{
                { "color", genome.color },
                { "parameters", parametersToJson(genome.policy.parameters()) },
            });
    }

    nlohmann::json hallOfFame = nlohmann::json::array();
    for (const auto& entry : saved.hallOfFame) {
        hallOfFame.push_back(retainedToJson(entry));
    }

    return nlohmann::json{
        { "version", FORMAT_VERSION },
        { "generation", saved.generation },
        { "config", saved.config },
        { "population", population },
        { "champion",
          saved.champion.has_value() ? retainedToJson(saved.champion.value()) : nullptr },
        { "hallOfFame", hallOfFame },
    };
}

Result<SavedPopulation, std::string> PopulationStore::fromJson(const nlohmann::json& json)
{
    using R = Result<SavedPopulation, std::string>;

    try {
        const int version = json.at("version").get<int>();
        if (version != FORMAT_VERSION) {
            return R::error("Unsupported population format version " + std::to_string(version));
        }

        SavedPopulation saved;
        json.at("config").get_to(saved.config);
        saved.generation = json.at("generation").get<int>();
        const HiddenActivation activation = saved.config.hiddenActivation;

        const auto& population = json.at("population");
        if (!population.is_array()
            || population.size() < static_cast<size_t>(EvolutionEngine::MIN_POPULATION_SIZE)) {
            return R::error("population must be an array of at least two genomes");
        }
        for (size_t i = 0; i < population.size(); i++) {
            const auto& entry = population[i];
            auto parameters =
                parametersFromJson(entry.at("parameters"), "population[" + std::to_string(i) + "]");
            if (parameters.isError()) {
                return R::error(parameters.errorValue());
            }
            saved.genomes.emplace_back(
                FeedforwardPolicy(parameters.value(), activation),
                entry.at("color").get<uint32_t>());
        }

        const auto& champion = json.at("champion");
        if (!champion.is_null()) {
            auto retained = retainedFromJson(champion, activation, "champion");
            if (retained.isError()) {
                return R::error(retained.errorValue());
            }
            saved.champion = retained.value();
        }

        const auto& hallOfFame = json.at("hallOfFame");
        for (size_t i = 0; i < hallOfFame.size(); i++) {
            auto retained = retainedFromJson(
                hallOfFame[i], activation, "hallOfFame[" + std::to_string(i) + "]");
            if (retained.isError()) {
                return R::error(retained.errorValue());
            }
            saved.hallOfFame.push_back(retained.value());
        }

        return R::okay(std::move(saved));
    }
    catch (const std::exception& e) {
        return R::error(std::string("Malformed population document: ") + e.what());
    }
}

Result<std::monostate, std::string> PopulationStore::save(
    const EvolutionEngine& engine, const std::filesystem::path& path)
{
    using R = Result<std::monostate, std::string>;

    try {
        std::ofstream file(path);
        if (!file.is_open()) {
            std::string error = "Cannot open " + path.string() + " for writing";
            LOG_ERROR(Storage, "PopulationStore: {}", error);
            return R::error(error);
        }
        file << toJson(capture(engine)).dump(2) << std::endl;
        if (!file) {
            std::string error = "Write failed for " + path.string();
            LOG_ERROR(Storage, "PopulationStore: {}", error);
            return R::error(error);
        }
    }
    catch (const std::exception& e) {
        std::string error = "Error writing " + path.string() + ": " + e.what();
        LOG_ERROR(Storage, "PopulationStore: {}", error);
        return R::error(error);
    }

    LOG_INFO(
        Storage,
        "Saved generation {} ({} genomes) to {}",
        engine.generation(),
        engine.populationSize(),
        path.string());
    return R::okay(std::monostate{});
}

Result<SavedPopulation, std::string> PopulationStore::load(const std::filesystem::path& path)
{
    using R = Result<SavedPopulation, std::string>;

    std::ifstream file(path);
    if (!file.is_open()) {
        std::string error = "Cannot open population file " + path.string();
        LOG_ERROR(Storage, "PopulationStore: {}", error);
        return R::error(error);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Storage, "PopulationStore: {}", error);
        return R::error(error);
    }

    auto result = fromJson(json);
    if (result.isError()) {
        LOG_ERROR(Storage, "PopulationStore: {}: {}", path.string(), result.errorValue());
        return result;
    }

    LOG_INFO(
        Storage,
        "Loaded generation {} ({} genomes) from {}",
        result.value().generation,
        result.value().genomes.size(),
        path.string());
    return result;
}

Result<std::monostate, std::string> PopulationStore::load(
    EvolutionEngine& engine, const std::filesystem::path& path)
{
    auto result = load(path);
    if (result.isError()) {
        return Result<std::monostate, std::string>::error(result.errorValue());
    }
    restoreInto(engine, std::move(result.value()));
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

} // namespace FlapEvo
