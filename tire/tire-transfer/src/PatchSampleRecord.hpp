// Ticket: 0001_flat_tire_records
// One statistical contact observation

#ifndef TIRE_TRANSFER_PATCH_SAMPLE_RECORD_HPP
#define TIRE_TRANSFER_PATCH_SAMPLE_RECORD_HPP

#include <limits>
#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for one contact-patch sample
 *
 * weight is an unnormalized importance score (e.g. sensor confidence).
 */
struct PatchSampleRecord
{
  float weight{std::numeric_limits<float>::quiet_NaN()};
  float penetration{std::numeric_limits<float>::quiet_NaN()};  // [m]
  float slip_x{std::numeric_limits<float>::quiet_NaN()};
  float slip_y{std::numeric_limits<float>::quiet_NaN()};
};

static_assert(std::is_standard_layout_v<PatchSampleRecord>);
static_assert(sizeof(PatchSampleRecord) == 4 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_PATCH_SAMPLE_RECORD_HPP
