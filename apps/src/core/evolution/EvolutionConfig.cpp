#include "EvolutionConfig.h"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace FlapEvo {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) {
        j.at(key).get_to(out);
    }
}

template <typename Enum, typename Parser>
void readEnumIfPresent(const nlohmann::json& j, const char* key, Enum& out, Parser parse)
{
    if (!j.contains(key)) {
        return;
    }
    const std::string name = j.at(key).get<std::string>();
    if (!parse(name, out)) {
        throw std::invalid_argument("Unknown value '" + name + "' for " + key);
    }
}

bool parseSelectionMode(const std::string& name, SelectionMode& out)
{
    if (name == "randomPair") {
        out = SelectionMode::RandomPair;
        return true;
    }
    if (name == "tournament") {
        out = SelectionMode::Tournament;
        return true;
    }
    return false;
}

bool parseCrossoverMode(const std::string& name, CrossoverMode& out)
{
    if (name == "uniform") {
        out = CrossoverMode::Uniform;
        return true;
    }
    if (name == "average") {
        out = CrossoverMode::Average;
        return true;
    }
    return false;
}

bool parseMutationSchedule(const std::string& name, MutationSchedule& out)
{
    if (name == "fixed") {
        out = MutationSchedule::Fixed;
        return true;
    }
    if (name == "annealed") {
        out = MutationSchedule::Annealed;
        return true;
    }
    return false;
}

struct KnobRange {
    const char* name;
    double* value;
    double low;
    double high;
    double fallback;
};

std::vector<KnobRange> rangedKnobs(EvolutionConfig& config)
{
    const EvolutionConfig defaults;
    const MutationConfig& d = defaults.mutation;
    MutationConfig& m = config.mutation;
    return {
        { "eliteFraction", &config.eliteFraction, 0.0, 1.0, defaults.eliteFraction },
        { "parameterLimit",
          &config.parameterLimit,
          0.0,
          MAX_PARAMETER_LIMIT,
          defaults.parameterLimit },
        { "mutation.baseRate", &m.baseRate, 0.0, 1.0, d.baseRate },
        { "mutation.midRate", &m.midRate, 0.0, 1.0, d.midRate },
        { "mutation.lateRate", &m.lateRate, 0.0, 1.0, d.lateRate },
        { "mutation.minRate", &m.minRate, 0.0, 1.0, d.minRate },
        { "mutation.fixedRate", &m.fixedRate, 0.0, 1.0, d.fixedRate },
        { "mutation.baseStep", &m.baseStep, 0.0, MAX_MUTATION_STEP, d.baseStep },
        { "mutation.midStep", &m.midStep, 0.0, MAX_MUTATION_STEP, d.midStep },
        { "mutation.lateStep", &m.lateStep, 0.0, MAX_MUTATION_STEP, d.lateStep },
        { "mutation.minStep", &m.minStep, 0.0, MAX_MUTATION_STEP, d.minStep },
        { "mutation.fixedStep", &m.fixedStep, 0.0, MAX_MUTATION_STEP, d.fixedStep },
        { "decision.flapThreshold",
          &config.decision.flapThreshold,
          0.0,
          1.0,
          defaults.decision.flapThreshold },
    };
}

} // namespace

std::vector<std::string> resetOutOfRangeKnobs(EvolutionConfig& config)
{
    std::vector<std::string> problems;
    for (const auto& knob : rangedKnobs(config)) {
        double& value = *knob.value;
        if (value >= knob.low && value <= knob.high) {
            continue;
        }
        problems.push_back(
            fmt::format(
                "{}={} outside [{}, {}], using default {}",
                knob.name,
                value,
                knob.low,
                knob.high,
                knob.fallback));
        value = knob.fallback;
    }
    return problems;
}

const char* toString(SelectionMode mode)
{
    switch (mode) {
        case SelectionMode::RandomPair:
            return "randomPair";
        case SelectionMode::Tournament:
            return "tournament";
    }
    return "";
}

const char* toString(CrossoverMode mode)
{
    switch (mode) {
        case CrossoverMode::Uniform:
            return "uniform";
        case CrossoverMode::Average:
            return "average";
    }
    return "";
}

const char* toString(MutationSchedule schedule)
{
    switch (schedule) {
        case MutationSchedule::Fixed:
            return "fixed";
        case MutationSchedule::Annealed:
            return "annealed";
    }
    return "";
}

EvolutionConfig makeClassicConfig()
{
    EvolutionConfig config;
    config.championEnabled = false;
    config.hallOfFameEnabled = false;
    config.selection = SelectionMode::RandomPair;
    config.crossover = CrossoverMode::Average;
    config.mutationSchedule = MutationSchedule::Fixed;
    config.hiddenActivation = HiddenActivation::Sigmoid;
    config.inputNormalization = InputNormalization::HeightScaled;
    config.eliteFraction = 0.1;
    config.clipParameters = false;
    return config;
}

EvolutionConfig makeChampionConfig()
{
    return EvolutionConfig{};
}

EvolutionConfig makeHallOfFameConfig()
{
    EvolutionConfig config;
    config.hallOfFameEnabled = true;
    return config;
}

std::optional<EvolutionConfig> makePresetConfig(const std::string& name)
{
    if (name == "classic") {
        return makeClassicConfig();
    }
    if (name == "champion") {
        return makeChampionConfig();
    }
    if (name == "hallOfFame") {
        return makeHallOfFameConfig();
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = nlohmann::json{
        { "baseRate", config.baseRate },
        { "baseStep", config.baseStep },
        { "midRate", config.midRate },
        { "midStep", config.midStep },
        { "lateRate", config.lateRate },
        { "lateStep", config.lateStep },
        { "minRate", config.minRate },
        { "minStep", config.minStep },
        { "midScoreThreshold", config.midScoreThreshold },
        { "lateScoreThreshold", config.lateScoreThreshold },
        { "fixedRate", config.fixedRate },
        { "fixedStep", config.fixedStep },
    };
}

void from_json(const nlohmann::json& j, MutationConfig& config)
{
    readIfPresent(j, "baseRate", config.baseRate);
    readIfPresent(j, "baseStep", config.baseStep);
    readIfPresent(j, "midRate", config.midRate);
    readIfPresent(j, "midStep", config.midStep);
    readIfPresent(j, "lateRate", config.lateRate);
    readIfPresent(j, "lateStep", config.lateStep);
    readIfPresent(j, "minRate", config.minRate);
    readIfPresent(j, "minStep", config.minStep);
    readIfPresent(j, "midScoreThreshold", config.midScoreThreshold);
    readIfPresent(j, "lateScoreThreshold", config.lateScoreThreshold);
    readIfPresent(j, "fixedRate", config.fixedRate);
    readIfPresent(j, "fixedStep", config.fixedStep);
}

void to_json(nlohmann::json& j, const DecisionConfig& config)
{
    j = nlohmann::json{
        { "useStochasticPolicy", config.useStochasticPolicy },
        { "flapThreshold", config.flapThreshold },
    };
}

void from_json(const nlohmann::json& j, DecisionConfig& config)
{
    readIfPresent(j, "useStochasticPolicy", config.useStochasticPolicy);
    readIfPresent(j, "flapThreshold", config.flapThreshold);
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = nlohmann::json{
        { "populationSize", config.populationSize },
        { "seed", config.seed },
        { "championEnabled", config.championEnabled },
        { "hallOfFameEnabled", config.hallOfFameEnabled },
        { "hallOfFameCandidates", config.hallOfFameCandidates },
        { "hallOfFameCapacity", config.hallOfFameCapacity },
        { "selection", toString(config.selection) },
        { "crossover", toString(config.crossover) },
        { "mutationSchedule", toString(config.mutationSchedule) },
        { "hiddenActivation", toString(config.hiddenActivation) },
        { "inputNormalization", toString(config.inputNormalization) },
        { "eliteFraction", config.eliteFraction },
        { "minEliteCount", config.minEliteCount },
        { "tournamentSize", config.tournamentSize },
        { "clipParameters", config.clipParameters },
        { "parameterLimit", config.parameterLimit },
        { "mutation", config.mutation },
        { "decision", config.decision },
    };
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    // A "preset" key selects the starting point; explicit keys then override it.
    if (j.contains("preset")) {
        const std::string preset = j.at("preset").get<std::string>();
        auto base = makePresetConfig(preset);
        if (!base.has_value()) {
            throw std::invalid_argument("Unknown preset '" + preset + "'");
        }
        config = base.value();
    }

    readIfPresent(j, "populationSize", config.populationSize);
    readIfPresent(j, "seed", config.seed);
    readIfPresent(j, "championEnabled", config.championEnabled);
    readIfPresent(j, "hallOfFameEnabled", config.hallOfFameEnabled);
    readIfPresent(j, "hallOfFameCandidates", config.hallOfFameCandidates);
    readIfPresent(j, "hallOfFameCapacity", config.hallOfFameCapacity);
    readEnumIfPresent(j, "selection", config.selection, parseSelectionMode);
    readEnumIfPresent(j, "crossover", config.crossover, parseCrossoverMode);
    readEnumIfPresent(j, "mutationSchedule", config.mutationSchedule, parseMutationSchedule);
    readEnumIfPresent(j, "hiddenActivation", config.hiddenActivation, parseHiddenActivation);
    readEnumIfPresent(
        j, "inputNormalization", config.inputNormalization, parseInputNormalization);
    readIfPresent(j, "eliteFraction", config.eliteFraction);
    readIfPresent(j, "minEliteCount", config.minEliteCount);
    readIfPresent(j, "tournamentSize", config.tournamentSize);
    readIfPresent(j, "clipParameters", config.clipParameters);
    readIfPresent(j, "parameterLimit", config.parameterLimit);
    readIfPresent(j, "mutation", config.mutation);
    readIfPresent(j, "decision", config.decision);

    EvolutionConfig checked = config;
    const auto problems = resetOutOfRangeKnobs(checked);
    if (!problems.empty()) {
        throw std::invalid_argument("Invalid evolution config: " + problems.front());
    }
}

} // namespace FlapEvo
