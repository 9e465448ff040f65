// Ticket: 0001_flat_tire_records
// Input of one wear/thermal step

#ifndef TIRE_TRANSFER_WEAR_THERMAL_INPUT_RECORD_HPP
#define TIRE_TRANSFER_WEAR_THERMAL_INPUT_RECORD_HPP

#include <limits>
#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for the wear/thermal step input
 *
 * The caller copies the previous step's WearThermalOutputRecord fields into
 * current_wear, surface_temperature and core_temperature before each step.
 *
 * @ticket 0001_flat_tire_records
 */
struct WearThermalInputRecord
{
  float slip_ratio{std::numeric_limits<float>::quiet_NaN()};
  float slip_angle{std::numeric_limits<float>::quiet_NaN()};             // [rad]
  float peak_pressure{std::numeric_limits<float>::quiet_NaN()};          // [Pa]
  float total_force_magnitude{std::numeric_limits<float>::quiet_NaN()};  // [N]
  float current_wear{std::numeric_limits<float>::quiet_NaN()};           // [0, 1]
  float base_wear_rate{std::numeric_limits<float>::quiet_NaN()};         // [1/s]
  float base_heat_generation{std::numeric_limits<float>::quiet_NaN()};   // [K/s]
  float cooling_rate{std::numeric_limits<float>::quiet_NaN()};           // [1/s]
  float ambient_temperature{std::numeric_limits<float>::quiet_NaN()};
  float surface_temperature{std::numeric_limits<float>::quiet_NaN()};
  float core_temperature{std::numeric_limits<float>::quiet_NaN()};
  float delta_time{std::numeric_limits<float>::quiet_NaN()};             // [s]
};

static_assert(std::is_standard_layout_v<WearThermalInputRecord>);
static_assert(sizeof(WearThermalInputRecord) == 12 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_WEAR_THERMAL_INPUT_RECORD_HPP
