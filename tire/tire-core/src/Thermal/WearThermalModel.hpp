// Ticket: 0007_wear_thermal_step

#ifndef TIRE_CORE_THERMAL_WEAR_THERMAL_MODEL_HPP
#define TIRE_CORE_THERMAL_WEAR_THERMAL_MODEL_HPP

#include "tire-transfer/src/WearThermalModelRecord.hpp"

namespace tire_core
{

/**
 * @brief Coefficients of the two-node wear/thermal model.
 *
 * Defaults reproduce the reference model:
 *   wearRate = baseWearRate * (1 + 5*slipRatio + 3*|slipAngle|)
 *              * (peakPressure / 10000)
 *   heat     = baseHeatGeneration * (1 + 3*slipRatio + 2*|slipAngle|)
 *              * (totalForceMagnitude / 10000)
 * with 70% of the heat routed to the surface node, the remainder to the
 * core node, and the core cooled at half the surface rate.
 *
 * @ticket 0007_wear_thermal_step
 */
struct WearThermalModel
{
  float wearSlipRatioGain{5.0F};
  float wearSlipAngleGain{3.0F};
  float heatSlipRatioGain{3.0F};
  float heatSlipAngleGain{2.0F};
  float pressureReference{10000.0F};  ///< [Pa]
  float forceReference{10000.0F};     ///< [N]
  float surfaceHeatShare{0.7F};       ///< [0, 1], core receives the rest
  float coreCoolingShare{0.5F};       ///< [0, 1] of the surface cooling

  /// @throws std::invalid_argument if any gain is negative or not finite
  void setWearGains(float slipRatioGain, float slipAngleGain);

  /// @throws std::invalid_argument if any gain is negative or not finite
  void setHeatGains(float slipRatioGain, float slipAngleGain);

  /// @throws std::invalid_argument unless both references are positive
  void setReferences(float pressure, float force);

  /// @throws std::invalid_argument unless share is in [0, 1]
  void setSurfaceHeatShare(float share);

  /// @throws std::invalid_argument unless share is in [0, 1]
  void setCoreCoolingShare(float share);

  [[nodiscard]] float coreHeatShare() const
  {
    return 1.0F - surfaceHeatShare;
  }

  static WearThermalModel fromRecord(
    const tire_transfer::WearThermalModelRecord& record);

  [[nodiscard]] tire_transfer::WearThermalModelRecord toRecord() const;
};

}  // namespace tire_core

#endif  // TIRE_CORE_THERMAL_WEAR_THERMAL_MODEL_HPP
