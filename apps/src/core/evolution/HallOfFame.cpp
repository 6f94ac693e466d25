#include "HallOfFame.h"

#include <algorithm>

namespace FlapEvo {

HallOfFame::HallOfFame(int capacity) : capacity_(std::max(1, capacity))
{}

void HallOfFame::offer(const std::vector<Genome>& sortedGeneration, int candidates)
{
    const size_t count =
        std::min(sortedGeneration.size(), static_cast<size_t>(std::max(0, candidates)));
    for (size_t i = 0; i < count; i++) {
        const Genome& genome = sortedGeneration[i];
        merge(
            RetainedPolicy{
                .policy = genome.policy,
                .score = genome.score,
                .fitness = genome.fitness(),
            });
    }
    sortAndTruncate();
}

void HallOfFame::ensureContains(const RetainedPolicy& entry)
{
    if (!contains(entry.policy) && static_cast<int>(entries_.size()) >= capacity_) {
        entries_.pop_back();
    }
    merge(entry);
    sortAndTruncate();
}

bool HallOfFame::contains(const FeedforwardPolicy& policy) const
{
    return std::any_of(entries_.begin(), entries_.end(), [&policy](const RetainedPolicy& held) {
        return held.policy == policy;
    });
}

void HallOfFame::assign(std::vector<RetainedPolicy> entries)
{
    entries_.clear();
    for (const auto& entry : entries) {
        merge(entry);
    }
    sortAndTruncate();
}

std::vector<RetainedPolicy>::iterator HallOfFame::find(const FeedforwardPolicy& policy)
{
    return std::find_if(entries_.begin(), entries_.end(), [&policy](const RetainedPolicy& held) {
        return held.policy == policy;
    });
}

void HallOfFame::merge(const RetainedPolicy& entry)
{
    auto held = find(entry.policy);
    if (held == entries_.end()) {
        entries_.push_back(entry);
        return;
    }
    if (entry.fitness > held->fitness) {
        held->score = entry.score;
        held->fitness = entry.fitness;
    }
}

void HallOfFame::sortAndTruncate()
{
    std::stable_sort(entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
        return a.fitness > b.fitness;
    });
    if (static_cast<int>(entries_.size()) > capacity_) {
        entries_.resize(capacity_);
    }
}

} // namespace FlapEvo
