// Ticket: 0005_wear_thermal_step

#ifndef TIRE_TRANSFER_WEAR_THERMAL_MODEL_RECORD_HPP
#define TIRE_TRANSFER_WEAR_THERMAL_MODEL_RECORD_HPP

#include <type_traits>

namespace tire_transfer
{

/**
 * @brief Flat record for the wear/thermal model coefficients
 *
 * Defaults reproduce the reference wear and heat formulas exactly.
 */
struct WearThermalModelRecord
{
  float wear_slip_ratio_gain{5.0F};
  float wear_slip_angle_gain{3.0F};
  float heat_slip_ratio_gain{3.0F};
  float heat_slip_angle_gain{2.0F};
  float pressure_reference{10000.0F};  // [Pa]
  float force_reference{10000.0F};     // [N]
  float surface_heat_share{0.7F};      // [0, 1]
  float core_cooling_share{0.5F};      // [0, 1]
};

static_assert(std::is_standard_layout_v<WearThermalModelRecord>);
static_assert(sizeof(WearThermalModelRecord) == 8 * sizeof(float));

}  // namespace tire_transfer

#endif  // TIRE_TRANSFER_WEAR_THERMAL_MODEL_RECORD_HPP
