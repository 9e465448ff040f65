// Ticket: 0001_flat_tire_records

#ifndef TIRE_TRANSFER_WEAR_THERMAL_OUTPUT_RECORD_HPP
#define TIRE_TRANSFER_WEAR_THERMAL_OUTPUT_RECORD_HPP

#include <limits>
#include <type_traits>

namespace tire_transfer
{

struct WearThermalOutputRecord
{
  float wear{std::numeric_limits<float>::quiet_NaN()};  // [0, 1]
  float surface_temperature{std::numeric_limits<float>::quiet_NaN()};
  float core_temperature{std::numeric_limits<float>::quiet_NaN()};
};

static_assert(std::is_standard_layout_v<WearThermalOutputRecord>);
static_assert(sizeof(WearThermalOutputRecord) == 3 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_WEAR_THERMAL_OUTPUT_RECORD_HPP
