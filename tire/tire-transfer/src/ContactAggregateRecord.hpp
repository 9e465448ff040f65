// Ticket: 0001_flat_tire_records
// Per-tick force/torque summary of a contact point set

#ifndef TIRE_TRANSFER_CONTACT_AGGREGATE_RECORD_HPP
#define TIRE_TRANSFER_CONTACT_AGGREGATE_RECORD_HPP

#include <limits>
#include <type_traits>

#include "tire-transfer/src/Vector3FRecord.hpp"

namespace tire_transfer
{

/**
 * @brief Flat record for the geometric contact aggregate
 *
 * Uses composed Vector3FRecord sub-records for the vector quantities. The
 * field order is part of the cross-boundary contract and must not change.
 *
 * @ticket 0001_flat_tire_records
 */
struct ContactAggregateRecord
{
  Vector3FRecord total_force;       // [N]
  Vector3FRecord total_torque;      // [N*m], about the caller's origin
  Vector3FRecord average_position;  // [m]

  float contact_area{std::numeric_limits<float>::quiet_NaN()};
  float max_pressure{std::numeric_limits<float>::quiet_NaN()};
  float weighted_grip{std::numeric_limits<float>::quiet_NaN()};
};

static_assert(std::is_standard_layout_v<ContactAggregateRecord>);
static_assert(sizeof(ContactAggregateRecord) == 12 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_CONTACT_AGGREGATE_RECORD_HPP
