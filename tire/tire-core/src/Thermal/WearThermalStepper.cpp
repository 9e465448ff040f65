// Ticket: 0007_wear_thermal_step

#include "tire-core/src/Thermal/WearThermalStepper.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace tire_core
{

// ========== WearThermalInput ==========

WearThermalInput WearThermalInput::fromRecord(
  const tire_transfer::WearThermalInputRecord& record)
{
  WearThermalInput input;
  input.slipRatio = record.slip_ratio;
  input.slipAngle = record.slip_angle;
  input.peakPressure = record.peak_pressure;
  input.totalForceMagnitude = record.total_force_magnitude;
  input.currentWear = record.current_wear;
  input.baseWearRate = record.base_wear_rate;
  input.baseHeatGeneration = record.base_heat_generation;
  input.coolingRate = record.cooling_rate;
  input.ambientTemperature = record.ambient_temperature;
  input.surfaceTemperature = record.surface_temperature;
  input.coreTemperature = record.core_temperature;
  input.deltaTime = record.delta_time;
  return input;
}

tire_transfer::WearThermalInputRecord WearThermalInput::toRecord() const
{
  tire_transfer::WearThermalInputRecord record;
  record.slip_ratio = slipRatio;
  record.slip_angle = slipAngle;
  record.peak_pressure = peakPressure;
  record.total_force_magnitude = totalForceMagnitude;
  record.current_wear = currentWear;
  record.base_wear_rate = baseWearRate;
  record.base_heat_generation = baseHeatGeneration;
  record.cooling_rate = coolingRate;
  record.ambient_temperature = ambientTemperature;
  record.surface_temperature = surfaceTemperature;
  record.core_temperature = coreTemperature;
  record.delta_time = deltaTime;
  return record;
}

// ========== Step ==========

WearThermalOutput stepWearAndTemperature(const WearThermalInput& input,
                                         const WearThermalModel& model)
{
  float const absSlipAngle = std::abs(input.slipAngle);
  float const dt = input.deltaTime;

  // Wear
  float const wearRate =
    input.baseWearRate *
    (1.0F + model.wearSlipRatioGain * input.slipRatio +
     model.wearSlipAngleGain * absSlipAngle) *
    (input.peakPressure / model.pressureReference);

  float wear = std::clamp(input.currentWear + wearRate * dt, 0.0F, 1.0F);
  if (!std::isfinite(wear))
  {
    spdlog::warn(
      "stepWearAndTemperature: non-finite wear (current={}, rate={}, dt={}) "
      "reset to 0",
      input.currentWear,
      wearRate,
      dt);
    wear = 0.0F;
  }

  // Heat generation, split between the two nodes
  float const heat =
    input.baseHeatGeneration *
    (1.0F + model.heatSlipRatioGain * input.slipRatio +
     model.heatSlipAngleGain * absSlipAngle) *
    (input.totalForceMagnitude / model.forceReference);
  float const surfaceHeat = heat * model.surfaceHeatShare;
  float const coreHeat = heat * model.coreHeatShare();

  // Single cooling source driven by the surface node
  float const cooling =
    input.coolingRate * (input.ambientTemperature - input.surfaceTemperature);

  WearThermalOutput output;
  output.wear = wear;
  output.surfaceTemperature =
    input.surfaceTemperature + surfaceHeat * dt + cooling * dt;
  output.coreTemperature = input.coreTemperature + coreHeat * dt +
                           cooling * model.coreCoolingShare * dt;
  return output;
}

WearThermalInput carryForward(WearThermalInput next,
                              const WearThermalOutput& previous)
{
  next.currentWear = previous.wear;
  next.surfaceTemperature = previous.surfaceTemperature;
  next.coreTemperature = previous.coreTemperature;
  return next;
}

}  // namespace tire_core
