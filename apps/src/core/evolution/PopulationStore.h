#pragma once

#include "EvolutionConfig.h"
#include "Genome.h"
#include "HallOfFame.h"
#include "core/Result.h"

#include <filesystem>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FlapEvo {

class EvolutionEngine;

/**
 * Evolved state of an engine, detached from it: enough to continue training in a
 * later process.
 */
struct SavedPopulation {
    EvolutionConfig config;
    int generation = 1;
    std::vector<Genome> genomes;
    std::optional<RetainedPolicy> champion;
    std::vector<RetainedPolicy> hallOfFame;
};

/**
 * JSON persistence for populations.
 *
 * Document layout:
 *   { "version": 1, "generation": N, "config": {...},
 *     "population": [ { "color": RGBA, "parameters": [49 numbers] }, ... ],
 *     "champion": null | { "score", "fitness", "parameters" },
 *     "hallOfFame": [ { "score", "fitness", "parameters" }, ... ] }
 *
 * Run state (alive, score, distance) is not stored.
 */
class PopulationStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    static SavedPopulation capture(const EvolutionEngine& engine);
    static void restoreInto(EvolutionEngine& engine, SavedPopulation saved);

    // Engine built from the saved configuration and restored from `saved`, ready for the next
    // generation. A fixed seed is offset by the generation for this engine's random stream
    // only, so config().seed, and everything saved from it, keeps the stored value.
    static std::unique_ptr<EvolutionEngine> resume(SavedPopulation saved);
    static uint32_t resumeSeed(uint32_t storedSeed, int generation);

    static nlohmann::json toJson(const SavedPopulation& saved);
    static Result<SavedPopulation, std::string> fromJson(const nlohmann::json& json);

    static Result<std::monostate, std::string> save(
        const EvolutionEngine& engine, const std::filesystem::path& path);
    static Result<SavedPopulation, std::string> load(const std::filesystem::path& path);

    // load() followed by restoreInto(). The engine keeps its own configuration; genomes
    // are rebuilt with the saved document's hidden activation.
    static Result<std::monostate, std::string> load(
        EvolutionEngine& engine, const std::filesystem::path& path);
};

} // namespace FlapEvo
