// Ticket: 0004_patch_statistics

#ifndef TIRE_CORE_PATCH_WEIGHT_NORMALIZER_HPP
#define TIRE_CORE_PATCH_WEIGHT_NORMALIZER_HPP

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

#include "tire-core/src/Conventions/TireConventions.hpp"

namespace tire_core
{

/**
 * @brief Normalize raw importance weights into a distribution.
 *
 * Weights not exceeding conventions.minPositiveWeight map to exactly 0, as
 * do NaN and infinite weights. The remaining weights are divided by their
 * sum, accumulated in double so finite weights near FLT_MAX cannot overflow
 * it. If that sum is <= conventions.epsilon the result is all zeros
 * (degenerate distribution).
 *
 * The output has the same length as the input, never contains NaN/Inf, and
 * sums to 0 or to 1 (within float rounding).
 *
 * @param weights Raw, unnormalized weights
 * @param conventions Numerical conventions (read-only)
 * @return Normalized weights, one per input weight
 *
 * @ticket 0004_patch_statistics
 */
[[nodiscard]] std::vector<float> normalizeWeights(
  std::span<const float> weights,
  const TireConventions& conventions = TireConventions{});

namespace detail
{

[[nodiscard]] inline bool isQualifyingWeight(float weight,
                                             const TireConventions& conventions)
{
  return std::isfinite(weight) && weight > conventions.minPositiveWeight;
}

void logDegenerateWeightSum(double sum, std::size_t count);

/**
 * @brief normalizeWeights() over any indexed weight source.
 *
 * weightAt(i) returns the i-th raw weight. Lets callers holding samples as
 * structures normalize without first copying the weights out.
 */
template <typename WeightAt>
[[nodiscard]] std::vector<float> normalizeWeightsWith(
  std::size_t count,
  WeightAt&& weightAt,
  const TireConventions& conventions)
{
  double sum{0.0};
  for (std::size_t i = 0; i < count; ++i)
  {
    float const w = weightAt(i);
    if (isQualifyingWeight(w, conventions))
    {
      sum += static_cast<double>(w);
    }
  }

  std::vector<float> normalized(count, 0.0F);

  if (!std::isfinite(sum) || sum <= static_cast<double>(conventions.epsilon))
  {
    if (count > 0)
    {
      logDegenerateWeightSum(sum, count);
    }
    return normalized;
  }

  for (std::size_t i = 0; i < count; ++i)
  {
    float const w = weightAt(i);
    if (isQualifyingWeight(w, conventions))
    {
      normalized[i] = static_cast<float>(static_cast<double>(w) / sum);
    }
  }

  return normalized;
}

}  // namespace detail

}  // namespace tire_core

#endif  // TIRE_CORE_PATCH_WEIGHT_NORMALIZER_HPP
