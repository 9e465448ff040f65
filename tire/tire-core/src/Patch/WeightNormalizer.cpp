// Ticket: 0004_patch_statistics

#include "tire-core/src/Patch/WeightNormalizer.hpp"

#include <spdlog/spdlog.h>

namespace tire_core
{

std::vector<float> normalizeWeights(std::span<const float> weights,
                                    const TireConventions& conventions)
{
  return detail::normalizeWeightsWith(
    weights.size(),
    [&](std::size_t i) { return weights[i]; },
    conventions);
}

namespace detail
{

void logDegenerateWeightSum(double sum, std::size_t count)
{
  spdlog::debug(
    "normalizeWeights: degenerate weight sum {} over {} weights, "
    "returning zeros",
    sum,
    count);
}

}  // namespace detail

}  // namespace tire_core
