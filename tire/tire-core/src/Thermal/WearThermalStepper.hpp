// Ticket: 0007_wear_thermal_step

#ifndef TIRE_CORE_THERMAL_WEAR_THERMAL_STEPPER_HPP
#define TIRE_CORE_THERMAL_WEAR_THERMAL_STEPPER_HPP

#include "tire-core/src/Thermal/WearThermalModel.hpp"
#include "tire-transfer/src/WearThermalInputRecord.hpp"
#include "tire-transfer/src/WearThermalOutputRecord.hpp"

namespace tire_core
{

/**
 * @brief Read-only input of one wear/thermal step.
 *
 * currentWear, surfaceTemperature and coreTemperature are the previous
 * step's WearThermalOutput; the caller owns that state between ticks.
 */
struct WearThermalInput
{
  float slipRatio{0.0F};
  float slipAngle{0.0F};            // [rad]
  float peakPressure{0.0F};         // [Pa]
  float totalForceMagnitude{0.0F};  // [N]
  float currentWear{0.0F};          // [0, 1]
  float baseWearRate{0.0F};         // [1/s]
  float baseHeatGeneration{0.0F};   // [K/s]
  float coolingRate{0.0F};          // [1/s]
  float ambientTemperature{0.0F};
  float surfaceTemperature{0.0F};
  float coreTemperature{0.0F};
  float deltaTime{0.0F};            // [s]

  static WearThermalInput fromRecord(
    const tire_transfer::WearThermalInputRecord& record);

  [[nodiscard]] tire_transfer::WearThermalInputRecord toRecord() const;
};

struct WearThermalOutput
{
  float wear{0.0F};  // [0, 1]
  float surfaceTemperature{0.0F};
  float coreTemperature{0.0F};

  static WearThermalOutput fromRecord(
    const tire_transfer::WearThermalOutputRecord& record)
  {
    return WearThermalOutput{
      record.wear, record.surface_temperature, record.core_temperature};
  }

  [[nodiscard]] tire_transfer::WearThermalOutputRecord toRecord() const
  {
    tire_transfer::WearThermalOutputRecord record;
    record.wear = wear;
    record.surface_temperature = surfaceTemperature;
    record.core_temperature = coreTemperature;
    return record;
  }
};

/**
 * @brief Advance wear and the surface/core temperatures by one explicit step.
 *
 * Wear: currentWear + wearRate * dt, clamped to [0, 1]; a non-finite result
 * is reset to 0 so upstream NaN/Inf never reaches the caller's wear state.
 *
 * Heat: surfaceHeatShare of the generated heat goes to the surface node, the
 * rest to the core node. Cooling is coolingRate * (ambient - surface), using
 * the incoming surface temperature, applied fully to the surface and at
 * coreCoolingShare to the core. Both are integrated by dt.
 *
 * Pure function: identical inputs give bit-identical outputs.
 *
 * @param input Step input (read-only, not retained)
 * @param model Model coefficients
 * @return Updated wear and temperatures
 *
 * @ticket 0007_wear_thermal_step
 */
[[nodiscard]] WearThermalOutput stepWearAndTemperature(
  const WearThermalInput& input,
  const WearThermalModel& model = WearThermalModel{});

/**
 * @brief Feed a step's output back into the next step's input.
 *
 * @return next with currentWear, surfaceTemperature and coreTemperature
 *         taken from previous
 */
[[nodiscard]] WearThermalInput carryForward(WearThermalInput next,
                                            const WearThermalOutput& previous);

}  // namespace tire_core

#endif  // TIRE_CORE_THERMAL_WEAR_THERMAL_STEPPER_HPP
