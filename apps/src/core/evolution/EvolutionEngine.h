#pragma once

#include "EvolutionConfig.h"
#include "Genome.h"
#include "HallOfFame.h"
#include "Mutation.h"
#include "core/brains/DecisionPolicy.h"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace FlapEvo {

/**
 * Outcome of one evolve() call.
 */
struct GenerationSummary {
    int finishedGeneration = 0;
    int generation = 0; // Generation number after the turnover.
    int bestScore = 0;
    double bestFitness = 0.0;
    std::optional<int> championScore;
    std::optional<double> championFitness;
    double mutationRate = 0.0;
    double mutationStep = 0.0;
    int eliteCount = 0;
    size_t hallOfFameSize = 0;
};

/**
 * Read-only view of one genome for the presentation layer.
 * Valid until the next evolve(), reset() or restore().
 */
struct PopulationEntryView {
    const FeedforwardPolicy* policy = nullptr;
    uint32_t color = 0;
};

/**
 * Genetic algorithm over a fixed-size population of flap policies.
 *
 * Driven by an external game loop: per-tick calls report progress and death for the
 * individual at a stable population index, and evolve() is called once every
 * individual is dead. Single-threaded; evolve() must not overlap per-tick calls.
 */
class EvolutionEngine {
public:
    static constexpr int MIN_POPULATION_SIZE = 2;

    explicit EvolutionEngine(const EvolutionConfig& config = EvolutionConfig{});

    // Random numbers come from `rngSeed` (0 = std::random_device); config().seed keeps the
    // configured value.
    EvolutionEngine(const EvolutionConfig& config, uint32_t rngSeed);

    // Fresh random population; generation, champion and hall of fame start over.
    void reset(int populationSize);

    // Per-episode reset of alive/score/distance. Policies are untouched.
    void resetRunState();

    void tickAlive(int index, double distance);
    void addScore(int index);
    void kill(int index);

    // One point for every alive genome; the game loop calls this when its leading bird
    // passes an obstacle.
    void awardScoreToAlive();

    // False for dead or out-of-range individuals.
    bool shouldFlap(int index, const Observation& observation);

    GenerationSummary evolve();

    std::vector<PopulationEntryView> currentPopulationSnapshot() const;

    // Replace evolved state wholesale (used by PopulationStore). Run state is fresh.
    void restore(
        int generation,
        std::vector<Genome> genomes,
        std::optional<RetainedPolicy> champion,
        std::vector<RetainedPolicy> hallOfFame);

    int generation() const { return generation_; }
    int populationSize() const { return static_cast<int>(genomes_.size()); }
    int aliveCount() const;
    bool allDead() const { return aliveCount() == 0; }

    const std::vector<Genome>& genomes() const { return genomes_; }
    const std::optional<RetainedPolicy>& champion() const { return champion_; }
    const HallOfFame& hallOfFame() const { return hallOfFame_; }
    const EvolutionConfig& config() const { return config_; }
    const DecisionPolicy& decisionPolicy() const { return decisionPolicy_; }
    const std::optional<GenerationSummary>& lastSummary() const { return lastSummary_; }
    uint32_t seed() const { return seed_; }

private:
    bool validIndex(int index) const
    {
        return index >= 0 && index < static_cast<int>(genomes_.size());
    }

    std::optional<WeightType> clipLimit() const;
    void updateChampion(const Genome& best);
    void updateHallOfFame();
    std::vector<Genome> buildNextGeneration(
        const std::vector<Genome>& elites, int eliteCount, const MutationParams& mutation);

    EvolutionConfig config_;
    DecisionPolicy decisionPolicy_;
    uint32_t seed_;
    std::mt19937 rng_;

    std::vector<Genome> genomes_;
    int generation_ = 1;

    std::optional<RetainedPolicy> champion_;
    HallOfFame hallOfFame_;
    std::optional<GenerationSummary> lastSummary_;
};

} // namespace FlapEvo
