#pragma once

#include "core/brains/DecisionPolicy.h"
#include "core/brains/FeedforwardPolicy.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace FlapEvo {

// Upper bounds for mutation steps and the clip limit.
constexpr double MAX_MUTATION_STEP = 100.0;
constexpr double MAX_PARAMETER_LIMIT = 1000.0;

enum class SelectionMode { RandomPair, Tournament };
enum class CrossoverMode { Uniform, Average };
enum class MutationSchedule { Fixed, Annealed };

const char* toString(SelectionMode mode);
const char* toString(CrossoverMode mode);
const char* toString(MutationSchedule schedule);

/**
 * Mutation knobs. The annealed schedule lowers rate and step as the best score of a
 * generation crosses the two thresholds, never going below the floors.
 */
struct MutationConfig {
    double baseRate = 0.18; // Probability each parameter is perturbed.
    double baseStep = 0.45; // Perturbation drawn from uniform(-step, step).
    double midRate = 0.12;
    double midStep = 0.25;
    double lateRate = 0.06;
    double lateStep = 0.15;
    double minRate = 0.05;
    double minStep = 0.10;
    int midScoreThreshold = 5;
    int lateScoreThreshold = 12;

    // Used by the fixed schedule ("tiny" mutation after averaging crossover).
    double fixedRate = 0.03;
    double fixedStep = 0.08;
};

/**
 * Configuration for the genetic algorithm. Engine variants are combinations of these
 * capability flags; see the preset functions below.
 */
struct EvolutionConfig {
    int populationSize = 50;
    uint32_t seed = 0; // 0 = seed from std::random_device.

    bool championEnabled = true;
    bool hallOfFameEnabled = false;
    int hallOfFameCandidates = 20; // Top individuals offered to the hall each generation.
    int hallOfFameCapacity = 10;

    SelectionMode selection = SelectionMode::Tournament;
    CrossoverMode crossover = CrossoverMode::Uniform;
    MutationSchedule mutationSchedule = MutationSchedule::Annealed;
    HiddenActivation hiddenActivation = HiddenActivation::Relu;
    InputNormalization inputNormalization = InputNormalization::GapRelative;

    double eliteFraction = 0.2;
    int minEliteCount = 2;
    int tournamentSize = 5;

    bool clipParameters = true;
    double parameterLimit = 6.0;

    MutationConfig mutation;
    DecisionConfig decision;
};

// Averaging crossover, random parents, fixed tiny mutation, sigmoid hidden layer.
EvolutionConfig makeClassicConfig();
// Champion preservation, tournament selection, uniform crossover, annealed mutation.
EvolutionConfig makeChampionConfig();
// Champion config plus hall of fame.
EvolutionConfig makeHallOfFameConfig();

std::optional<EvolutionConfig> makePresetConfig(const std::string& name);

/**
 * Resets every knob outside its accepted range to the default and describes each reset.
 * Rates, eliteFraction and flapThreshold live in [0, 1], steps in [0, MAX_MUTATION_STEP],
 * parameterLimit in [0, MAX_PARAMETER_LIMIT]. NaN is always out of range.
 */
std::vector<std::string> resetOutOfRangeKnobs(EvolutionConfig& config);

void to_json(nlohmann::json& j, const MutationConfig& config);
void from_json(const nlohmann::json& j, MutationConfig& config);

void to_json(nlohmann::json& j, const DecisionConfig& config);
void from_json(const nlohmann::json& j, DecisionConfig& config);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
// Throws std::invalid_argument for unknown names and out-of-range knobs.
void from_json(const nlohmann::json& j, EvolutionConfig& config);

} // namespace FlapEvo
