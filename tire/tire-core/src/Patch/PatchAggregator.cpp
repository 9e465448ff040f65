// Ticket: 0004_patch_statistics

#include "tire-core/src/Patch/PatchAggregator.hpp"

#include <spdlog/spdlog.h>

namespace tire_core
{

// ========== PatchAggregate ==========

PatchAggregate PatchAggregate::fromRecord(
  const tire_transfer::PatchAggregateRecord& record)
{
  return PatchAggregate{record.contact_confidence,
                        record.penetration_avg,
                        record.penetration_max,
                        record.slip_x_avg,
                        record.slip_y_avg};
}

tire_transfer::PatchAggregateRecord PatchAggregate::toRecord() const
{
  tire_transfer::PatchAggregateRecord record;
  record.contact_confidence = contactConfidence;
  record.penetration_avg = penetrationAvg;
  record.penetration_max = penetrationMax;
  record.slip_x_avg = slipXAvg;
  record.slip_y_avg = slipYAvg;
  return record;
}

// ========== Aggregation ==========

std::optional<PatchAggregate> tryAggregatePatch(
  std::span<const PatchSample> samples,
  const TireConventions& conventions)
{
  if (samples.empty())
  {
    return std::nullopt;
  }

  return detail::accumulatePatch(
    samples.size(),
    [&](std::size_t i) { return samples[i]; },
    conventions);
}

PatchAggregate aggregatePatch(std::span<const PatchSample> samples,
                              const TireConventions& conventions)
{
  auto result = tryAggregatePatch(samples, conventions);
  if (!result.has_value())
  {
    spdlog::debug("aggregatePatch: empty sample list, returning zero aggregate");
    return PatchAggregate{};
  }
  return *result;
}

}  // namespace tire_core
