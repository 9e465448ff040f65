// Ticket: 0001_flat_tire_records

#ifndef TIRE_TRANSFER_VECTOR3F_RECORD_HPP
#define TIRE_TRANSFER_VECTOR3F_RECORD_HPP

#include <limits>
#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for a single-precision 3D vector
 *
 * Stores the x, y, z components of a tire_core::Vector3F (or any of its
 * semantic wrappers) as individual scalar floats. Used as a composed
 * sub-record by the aggregate records.
 */
struct Vector3FRecord
{
  float x{std::numeric_limits<float>::quiet_NaN()};
  float y{std::numeric_limits<float>::quiet_NaN()};
  float z{std::numeric_limits<float>::quiet_NaN()};
};

static_assert(std::is_standard_layout_v<Vector3FRecord>);
static_assert(sizeof(Vector3FRecord) == 3 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_VECTOR3F_RECORD_HPP
