// Ticket: 0004_patch_statistics

#ifndef TIRE_CORE_PATCH_PATCH_AGGREGATOR_HPP
#define TIRE_CORE_PATCH_PATCH_AGGREGATOR_HPP

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "tire-core/src/Conventions/TireConventions.hpp"
#include "tire-core/src/Patch/WeightNormalizer.hpp"
#include "tire-transfer/src/PatchAggregateRecord.hpp"
#include "tire-transfer/src/PatchSampleRecord.hpp"

namespace tire_core
{

/**
 * @brief One statistical contact observation.
 *
 * weight is an unnormalized importance score and may be zero or negative;
 * such samples carry no influence after normalization.
 */
struct PatchSample
{
  float weight{0.0F};
  float penetration{0.0F};  // [m]
  float slipX{0.0F};
  float slipY{0.0F};

  static PatchSample fromRecord(const tire_transfer::PatchSampleRecord& record)
  {
    return PatchSample{
      record.weight, record.penetration, record.slip_x, record.slip_y};
  }

  [[nodiscard]] tire_transfer::PatchSampleRecord toRecord() const
  {
    tire_transfer::PatchSampleRecord record;
    record.weight = weight;
    record.penetration = penetration;
    record.slip_x = slipX;
    record.slip_y = slipY;
    return record;
  }
};

/**
 * @brief Confidence-weighted summary of a set of patch samples.
 *
 * contactConfidence is the share of normalized weight held by samples that
 * are in contact, so marginal contact reads lower than solid contact.
 * penetrationMax is the worst single sample regardless of its weight.
 */
struct PatchAggregate
{
  float contactConfidence{0.0F};  // [0, 1]
  float penetrationAvg{0.0F};     // [m]
  float penetrationMax{0.0F};     // [m]
  float slipXAvg{0.0F};
  float slipYAvg{0.0F};

  static PatchAggregate fromRecord(
    const tire_transfer::PatchAggregateRecord& record);

  [[nodiscard]] tire_transfer::PatchAggregateRecord toRecord() const;
};

/**
 * @brief Aggregate patch samples into a single per-tick summary.
 *
 * An empty sample list yields an all-zero aggregate.
 *
 * @param samples Samples for this tick (possibly empty)
 * @param conventions Numerical conventions (read-only)
 * @return The aggregate
 *
 * @ticket 0004_patch_statistics
 */
[[nodiscard]] PatchAggregate aggregatePatch(
  std::span<const PatchSample> samples,
  const TireConventions& conventions = TireConventions{});

/**
 * @brief Aggregate patch samples, distinguishing an empty input.
 *
 * @return std::nullopt when samples is empty, otherwise the same value
 *         aggregatePatch() returns
 */
[[nodiscard]] std::optional<PatchAggregate> tryAggregatePatch(
  std::span<const PatchSample> samples,
  const TireConventions& conventions = TireConventions{});

namespace detail
{

/**
 * @brief Patch aggregation over any indexed sample source.
 *
 * sampleAt(i) returns the i-th PatchSample; count must be > 0. The only
 * allocation is the normalized weight vector.
 */
template <typename SampleAt>
[[nodiscard]] PatchAggregate accumulatePatch(std::size_t count,
                                             SampleAt&& sampleAt,
                                             const TireConventions& conventions)
{
  std::vector<float> const weights = normalizeWeightsWith(
    count,
    [&](std::size_t i) { return sampleAt(i).weight; },
    conventions);

  PatchAggregate result{};
  for (std::size_t i = 0; i < count; ++i)
  {
    PatchSample const sample = sampleAt(i);
    float const w = weights[i];

    if (sample.penetration > conventions.contactPenetrationThreshold)
    {
      result.contactConfidence += w;
    }
    result.penetrationAvg += sample.penetration * w;
    result.penetrationMax = std::max(result.penetrationMax, sample.penetration);
    result.slipXAvg += sample.slipX * w;
    result.slipYAvg += sample.slipY * w;
  }

  // Summation drift can leave the confidence a few ulps outside [0, 1]
  result.contactConfidence = std::clamp(result.contactConfidence, 0.0F, 1.0F);

  return result;
}

}  // namespace detail

}  // namespace tire_core

template <>
struct fmt::formatter<tire_core::PatchAggregate>
{
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tire_core::PatchAggregate& patch,
              FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "PatchAggregate{{confidence={:.4f}, "
                          "penetration(avg={:.6f}, max={:.6f}), "
                          "slip=({:.4f}, {:.4f})}}",
                          patch.contactConfidence,
                          patch.penetrationAvg,
                          patch.penetrationMax,
                          patch.slipXAvg,
                          patch.slipYAvg);
  }
};

#endif  // TIRE_CORE_PATCH_PATCH_AGGREGATOR_HPP
