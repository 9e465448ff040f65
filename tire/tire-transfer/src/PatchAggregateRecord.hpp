// Ticket: 0001_flat_tire_records
// Per-tick statistical summary of a contact patch

#ifndef TIRE_TRANSFER_PATCH_AGGREGATE_RECORD_HPP
#define TIRE_TRANSFER_PATCH_AGGREGATE_RECORD_HPP

#include <limits>
#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for the statistical patch aggregate
 *
 * @ticket 0001_flat_tire_records
 */
struct PatchAggregateRecord
{
  float contact_confidence{std::numeric_limits<float>::quiet_NaN()};  // [0, 1]
  float penetration_avg{std::numeric_limits<float>::quiet_NaN()};     // [m]
  float penetration_max{std::numeric_limits<float>::quiet_NaN()};     // [m]
  float slip_x_avg{std::numeric_limits<float>::quiet_NaN()};
  float slip_y_avg{std::numeric_limits<float>::quiet_NaN()};
};

static_assert(std::is_standard_layout_v<PatchAggregateRecord>);
static_assert(sizeof(PatchAggregateRecord) == 5 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_PATCH_AGGREGATE_RECORD_HPP
