#include "Genome.h"

#include "core/ColorNames.h"

#include <utility>

namespace FlapEvo {

Genome::Genome(FeedforwardPolicy policy, uint32_t color) : policy(std::move(policy)), color(color)
{}

Genome Genome::withRandomColor(FeedforwardPolicy policy, std::mt19937& rng)
{
    std::uniform_real_distribution<float> hue(0.0f, 1.0f);
    return Genome(std::move(policy), ColorNames::hsv(hue(rng), 0.8f, 0.9f));
}

void Genome::resetRunState()
{
    alive = true;
    score = 0;
    distance = 0.0;
}

} // namespace FlapEvo
