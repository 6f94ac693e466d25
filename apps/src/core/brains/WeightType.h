#pragma once

namespace FlapEvo {

using WeightType = double;

} // namespace FlapEvo
