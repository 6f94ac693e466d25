#include "EvolutionEngine.h"

#include "Crossover.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <utility>

namespace FlapEvo {

namespace {

uint32_t resolveSeed(uint32_t configured)
{
    if (configured != 0) {
        return configured;
    }
    std::random_device device;
    return device();
}

EvolutionConfig withValidRanges(EvolutionConfig config)
{
    for (const auto& problem : resetOutOfRangeKnobs(config)) {
        LOG_WARN(Evolution, "EvolutionEngine: config {}", problem);
    }
    return config;
}

bool containsPolicy(const std::vector<Genome>& genomes, const FeedforwardPolicy& policy)
{
    return std::any_of(genomes.begin(), genomes.end(), [&policy](const Genome& genome) {
        return genome.policy == policy;
    });
}

} // namespace

EvolutionEngine::EvolutionEngine(const EvolutionConfig& config)
    : EvolutionEngine(config, config.seed)
{}

EvolutionEngine::EvolutionEngine(const EvolutionConfig& config, uint32_t rngSeed)
    : config_(withValidRanges(config)),
      decisionPolicy_(config_.decision, config_.inputNormalization),
      seed_(resolveSeed(rngSeed)),
      rng_(seed_),
      hallOfFame_(config_.hallOfFameCapacity)
{
    LOG_DEBUG(
        Evolution,
        "EvolutionEngine: seed={} selection={} crossover={} schedule={} champion={} "
        "hallOfFame={}",
        seed_,
        toString(config_.selection),
        toString(config_.crossover),
        toString(config_.mutationSchedule),
        config_.championEnabled,
        config_.hallOfFameEnabled);
    reset(config_.populationSize);
}

void EvolutionEngine::reset(int populationSize)
{
    if (populationSize < MIN_POPULATION_SIZE) {
        LOG_WARN(
            Evolution,
            "Population size {} below minimum, using {}",
            populationSize,
            MIN_POPULATION_SIZE);
        populationSize = MIN_POPULATION_SIZE;
    }

    genomes_.clear();
    genomes_.reserve(populationSize);
    for (int i = 0; i < populationSize; i++) {
        genomes_.push_back(
            Genome::withRandomColor(
                FeedforwardPolicy::random(config_.hiddenActivation, rng_), rng_));
    }

    generation_ = 1;
    champion_.reset();
    hallOfFame_.clear();
    lastSummary_.reset();

    LOG_INFO(Evolution, "Population reset: {} random genomes", populationSize);
}

void EvolutionEngine::resetRunState()
{
    for (auto& genome : genomes_) {
        genome.resetRunState();
    }
}

void EvolutionEngine::tickAlive(int index, double distance)
{
    if (!validIndex(index)) {
        return;
    }
    Genome& genome = genomes_[index];
    if (genome.alive) {
        genome.distance = std::max(genome.distance, distance);
    }
}

void EvolutionEngine::addScore(int index)
{
    if (!validIndex(index)) {
        return;
    }
    Genome& genome = genomes_[index];
    if (genome.alive) {
        genome.score++;
    }
}

void EvolutionEngine::kill(int index)
{
    if (!validIndex(index)) {
        return;
    }
    genomes_[index].alive = false;
}

void EvolutionEngine::awardScoreToAlive()
{
    for (auto& genome : genomes_) {
        if (genome.alive) {
            genome.score++;
        }
    }
}

bool EvolutionEngine::shouldFlap(int index, const Observation& observation)
{
    if (!validIndex(index) || !genomes_[index].alive) {
        return false;
    }
    return decisionPolicy_.shouldFlap(genomes_[index].policy, observation, rng_);
}

int EvolutionEngine::aliveCount() const
{
    return static_cast<int>(
        std::count_if(genomes_.begin(), genomes_.end(), [](const Genome& g) { return g.alive; }));
}

GenerationSummary EvolutionEngine::evolve()
{
    FLAPEVO_ASSERT(!genomes_.empty(), "evolve() requires a population");

    const int stillAlive = aliveCount();
    if (stillAlive > 0) {
        LOG_WARN(Evolution, "evolve() called with {} genomes still alive", stillAlive);
    }

    std::stable_sort(genomes_.begin(), genomes_.end(), [](const Genome& a, const Genome& b) {
        return a.fitness() > b.fitness();
    });

    const Genome& best = genomes_.front();
    const int bestScore = best.score;
    const double bestFitness = best.fitness();

    if (config_.championEnabled) {
        updateChampion(best);
    }
    if (config_.hallOfFameEnabled) {
        updateHallOfFame();
    }

    const int eliteCount =
        computeEliteCount(populationSize(), config_.eliteFraction, config_.minEliteCount);
    const std::vector<Genome> elites(genomes_.begin(), genomes_.begin() + eliteCount);

    MutationParams mutation =
        computeMutationParams(config_.mutation, config_.mutationSchedule, bestScore);
    mutation.clipLimit = clipLimit();

    GenerationSummary summary{
        .finishedGeneration = generation_,
        .generation = generation_ + 1,
        .bestScore = bestScore,
        .bestFitness = bestFitness,
        .mutationRate = mutation.rate,
        .mutationStep = mutation.step,
        .eliteCount = eliteCount,
    };
    if (champion_.has_value()) {
        summary.championScore = champion_->score;
        summary.championFitness = champion_->fitness;
    }

    genomes_ = buildNextGeneration(elites, eliteCount, mutation);
    generation_++;
    summary.hallOfFameSize = hallOfFame_.size();

    LOG_INFO(
        Evolution,
        "=== Generation {} === bestScore(gen)={} | championScore={} | rate={:.3f} step={:.3f}",
        generation_,
        bestScore,
        summary.championScore.value_or(0),
        mutation.rate,
        mutation.step);
    LOG_DEBUG(
        Evolution,
        "Generation {} detail: bestFitness={:.1f} elites={} hallOfFame={}",
        summary.finishedGeneration,
        bestFitness,
        eliteCount,
        summary.hallOfFameSize);

    lastSummary_ = summary;
    return summary;
}

std::vector<PopulationEntryView> EvolutionEngine::currentPopulationSnapshot() const
{
    std::vector<PopulationEntryView> views;
    views.reserve(genomes_.size());
    for (const auto& genome : genomes_) {
        views.push_back(PopulationEntryView{ .policy = &genome.policy, .color = genome.color });
    }
    return views;
}

void EvolutionEngine::restore(
    int generation,
    std::vector<Genome> genomes,
    std::optional<RetainedPolicy> champion,
    std::vector<RetainedPolicy> hallOfFame)
{
    FLAPEVO_ASSERT(
        static_cast<int>(genomes.size()) >= MIN_POPULATION_SIZE,
        "restore() requires at least two genomes");

    genomes_ = std::move(genomes);
    for (auto& genome : genomes_) {
        genome.resetRunState();
    }
    generation_ = std::max(1, generation);
    champion_ = std::move(champion);
    hallOfFame_.assign(std::move(hallOfFame));
    lastSummary_.reset();

    LOG_INFO(
        Evolution,
        "Restored generation {} with {} genomes (champion={}, hallOfFame={})",
        generation_,
        genomes_.size(),
        champion_.has_value(),
        hallOfFame_.size());
}

std::optional<WeightType> EvolutionEngine::clipLimit() const
{
    if (!config_.clipParameters) {
        return std::nullopt;
    }
    return config_.parameterLimit;
}

void EvolutionEngine::updateChampion(const Genome& best)
{
    const double fitness = best.fitness();
    if (champion_.has_value() && fitness <= champion_->fitness) {
        return;
    }

    LOG_DEBUG(
        Evolution,
        "New champion in generation {}: score={} fitness={:.1f} (previous {:.1f})",
        generation_,
        best.score,
        fitness,
        champion_.has_value() ? champion_->fitness : 0.0);

    champion_ = RetainedPolicy{ .policy = best.policy, .score = best.score, .fitness = fitness };
}

void EvolutionEngine::updateHallOfFame()
{
    hallOfFame_.offer(genomes_, config_.hallOfFameCandidates);
    if (champion_.has_value()) {
        hallOfFame_.ensureContains(champion_.value());
    }
    LOG_DEBUG(
        Evolution,
        "Hall of fame: {} entries, top fitness {:.1f}",
        hallOfFame_.size(),
        hallOfFame_.empty() ? 0.0 : hallOfFame_.entries().front().fitness);
}

std::vector<Genome> EvolutionEngine::buildNextGeneration(
    const std::vector<Genome>& elites, int eliteCount, const MutationParams& mutation)
{
    const int popSize = populationSize();
    std::vector<Genome> next;
    next.reserve(popSize);

    const auto preservedFull = [&]() { return static_cast<int>(next.size()) >= eliteCount; };

    // Each network occupies at most one preserved slot.
    const auto preserve = [&](const FeedforwardPolicy& policy) {
        if (!containsPolicy(next, policy)) {
            next.push_back(Genome::withRandomColor(policy, rng_));
        }
    };

    // Slot 0: the all-time champion, unmutated.
    if (champion_.has_value()) {
        preserve(champion_->policy);
    }

    // Hall of fame clones come before this generation's elites.
    if (config_.hallOfFameEnabled) {
        for (const auto& entry : hallOfFame_.entries()) {
            if (preservedFull()) {
                break;
            }
            preserve(entry.policy);
        }
    }

    for (const auto& elite : elites) {
        if (preservedFull()) {
            break;
        }
        preserve(elite.policy);
    }

    std::vector<double> eliteFitness;
    eliteFitness.reserve(elites.size());
    for (const auto& elite : elites) {
        eliteFitness.push_back(elite.fitness());
    }

    MutationStats stats;
    int totalPerturbations = 0;
    const int preserved = static_cast<int>(next.size());

    while (static_cast<int>(next.size()) < popSize) {
        const size_t p1 =
            selectParent(config_.selection, eliteFitness, config_.tournamentSize, rng_);
        const size_t p2 =
            selectParent(config_.selection, eliteFitness, config_.tournamentSize, rng_);

        FeedforwardPolicy child = crossover(
            config_.crossover, elites[p1].policy, elites[p2].policy, rng_, mutation.clipLimit);
        mutate(child, mutation, rng_, &stats);
        totalPerturbations += stats.perturbations;

        next.push_back(Genome::withRandomColor(std::move(child), rng_));
    }

    LOG_DEBUG(
        Evolution,
        "Next generation: {} preserved, {} offspring, {} parameter perturbations",
        preserved,
        popSize - preserved,
        totalPerturbations);

    return next;
}

} // namespace FlapEvo
