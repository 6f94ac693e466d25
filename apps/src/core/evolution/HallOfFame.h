#pragma once

#include "Genome.h"
#include "core/brains/FeedforwardPolicy.h"

#include <cstddef>
#include <vector>

namespace FlapEvo {

/**
 * Snapshot of a network taken when it ranked highly, independent of the live population.
 */
struct RetainedPolicy {
    FeedforwardPolicy policy;
    int score = 0;
    double fitness = 0.0;

    bool operator==(const RetainedPolicy& other) const = default;
};

/**
 * Bounded pool of historically top-ranked networks, sorted by descending fitness.
 * Entries are only evicted by rank, never by age. Each network is held at most once, with
 * the best result it has achieved.
 */
class HallOfFame {
public:
    explicit HallOfFame(int capacity = 10);

    // Clone the first `candidates` genomes of a fitness-sorted generation into the pool,
    // then re-sort and truncate to capacity.
    void offer(const std::vector<Genome>& sortedGeneration, int candidates);

    // Re-insert `entry` if its network is missing, replacing the lowest-ranked entry when
    // full.
    void ensureContains(const RetainedPolicy& entry);

    bool contains(const FeedforwardPolicy& policy) const;

    const std::vector<RetainedPolicy>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    int capacity() const { return capacity_; }

    void clear() { entries_.clear(); }

    // Replace all entries (used when restoring saved state); sorted and truncated.
    void assign(std::vector<RetainedPolicy> entries);

private:
    std::vector<RetainedPolicy>::iterator find(const FeedforwardPolicy& policy);

    // Append `entry`, or raise the held copy of the same network to the better result.
    void merge(const RetainedPolicy& entry);
    void sortAndTruncate();

    int capacity_;
    std::vector<RetainedPolicy> entries_;
};

} // namespace FlapEvo
