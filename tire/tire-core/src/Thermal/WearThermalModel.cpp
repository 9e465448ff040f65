// Ticket: 0007_wear_thermal_step

#include "tire-core/src/Thermal/WearThermalModel.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tire_core
{

namespace
{

void requireNonNegative(const char* name, float value)
{
  if (!std::isfinite(value) || value < 0.0F)
  {
    throw std::invalid_argument(std::string{"WearThermalModel: "} + name +
                                " must be non-negative and finite, got: " +
                                std::to_string(value));
  }
}

void requirePositive(const char* name, float value)
{
  if (!std::isfinite(value) || value <= 0.0F)
  {
    throw std::invalid_argument(std::string{"WearThermalModel: "} + name +
                                " must be positive and finite, got: " +
                                std::to_string(value));
  }
}

void requireFraction(const char* name, float value)
{
  if (!(value >= 0.0F && value <= 1.0F))
  {
    throw std::invalid_argument(std::string{"WearThermalModel: "} + name +
                                " must be in [0, 1], got: " +
                                std::to_string(value));
  }
}

}  // namespace

void WearThermalModel::setWearGains(float slipRatioGain, float slipAngleGain)
{
  requireNonNegative("wearSlipRatioGain", slipRatioGain);
  requireNonNegative("wearSlipAngleGain", slipAngleGain);
  wearSlipRatioGain = slipRatioGain;
  wearSlipAngleGain = slipAngleGain;
}

void WearThermalModel::setHeatGains(float slipRatioGain, float slipAngleGain)
{
  requireNonNegative("heatSlipRatioGain", slipRatioGain);
  requireNonNegative("heatSlipAngleGain", slipAngleGain);
  heatSlipRatioGain = slipRatioGain;
  heatSlipAngleGain = slipAngleGain;
}

void WearThermalModel::setReferences(float pressure, float force)
{
  requirePositive("pressureReference", pressure);
  requirePositive("forceReference", force);
  pressureReference = pressure;
  forceReference = force;
}

void WearThermalModel::setSurfaceHeatShare(float share)
{
  requireFraction("surfaceHeatShare", share);
  surfaceHeatShare = share;
}

void WearThermalModel::setCoreCoolingShare(float share)
{
  requireFraction("coreCoolingShare", share);
  coreCoolingShare = share;
}

WearThermalModel WearThermalModel::fromRecord(
  const tire_transfer::WearThermalModelRecord& record)
{
  return WearThermalModel{record.wear_slip_ratio_gain,
                          record.wear_slip_angle_gain,
                          record.heat_slip_ratio_gain,
                          record.heat_slip_angle_gain,
                          record.pressure_reference,
                          record.force_reference,
                          record.surface_heat_share,
                          record.core_cooling_share};
}

tire_transfer::WearThermalModelRecord WearThermalModel::toRecord() const
{
  tire_transfer::WearThermalModelRecord record;
  record.wear_slip_ratio_gain = wearSlipRatioGain;
  record.wear_slip_angle_gain = wearSlipAngleGain;
  record.heat_slip_ratio_gain = heatSlipRatioGain;
  record.heat_slip_angle_gain = heatSlipAngleGain;
  record.pressure_reference = pressureReference;
  record.force_reference = forceReference;
  record.surface_heat_share = surfaceHeatShare;
  record.core_cooling_share = coreCoolingShare;
  return record;
}

}  // namespace tire_core
