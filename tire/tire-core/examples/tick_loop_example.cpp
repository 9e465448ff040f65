// Ticket: 0007_wear_thermal_step
// Drives the core the way an owning vehicle-dynamics engine would: the
// caller keeps wear and temperature between ticks and feeds each output
// back as the next input.

#include <spdlog/spdlog.h>

#include <array>
#include <cmath>

#include "tire-core/src/Contact/ContactAggregator.hpp"
#include "tire-core/src/Patch/PatchAggregator.hpp"
#include "tire-core/src/Radius/EffectiveRadius.hpp"
#include "tire-core/src/Thermal/WearThermalStepper.hpp"

using namespace tire_core;

int main()
{
  spdlog::set_level(spdlog::level::info);

  constexpr float kDt = 0.01F;
  constexpr int kTicks = 500;
  constexpr float kTireRadius = 0.34F;
  constexpr float kRimRadius = 0.27F;
  constexpr float kStiffness = 120000.0F;

  WearThermalInput thermal{};
  thermal.baseWearRate = 2.0e-5F;
  thermal.baseHeatGeneration = 4.0F;
  thermal.coolingRate = 0.08F;
  thermal.ambientTemperature = 22.0F;
  thermal.surfaceTemperature = 22.0F;
  thermal.coreTemperature = 22.0F;
  thermal.deltaTime = kDt;

  for (int tick = 0; tick < kTicks; ++tick)
  {
    float const t = static_cast<float>(tick) * kDt;
    float const slipRatio = 0.05F + 0.04F * std::sin(2.0F * t);
    float const slipAngle = 0.03F * std::cos(1.5F * t);

    // Four contacts across the footprint, vertical load along x
    std::array<ContactPoint, 4> const contacts{
      ContactPoint{
        Coordinate{-0.305F, -0.06F, 0.05F}, Vector3F{1.0F, 0.0F, 0.0F}, 1000.0F, 1.0F},
      ContactPoint{
        Coordinate{-0.305F, 0.06F, 0.05F}, Vector3F{1.0F, 0.0F, 0.0F}, 1100.0F, 1.0F},
      ContactPoint{
        Coordinate{-0.305F, -0.06F, -0.05F}, Vector3F{1.0F, 0.02F, 0.0F}, 1050.0F, 0.95F},
      ContactPoint{
        Coordinate{-0.305F, 0.06F, -0.05F}, Vector3F{1.0F, 0.02F, 0.0F}, 1050.0F, 0.95F}};

    ContactAggregate const contact =
      aggregateContacts(contacts, Coordinate{}, kStiffness);

    std::array<PatchSample, 3> const samples{
      PatchSample{1.0F, 0.012F, slipRatio, slipAngle},
      PatchSample{0.8F, 0.010F, slipRatio * 1.1F, slipAngle},
      PatchSample{0.2F, 0.000F, slipRatio * 0.9F, slipAngle}};
    PatchAggregate const patch = aggregatePatch(samples);

    float const radius = computeEffectiveRadius(
      kTireRadius, kRimRadius, contact.totalForce.x(), kStiffness);

    thermal.slipRatio = patch.slipXAvg;
    thermal.slipAngle = patch.slipYAvg;
    thermal.peakPressure = contact.maxPressure * 200.0F;
    thermal.totalForceMagnitude = contact.totalForce.length();

    WearThermalOutput const output = stepWearAndTemperature(thermal);
    thermal = carryForward(thermal, output);

    if (tick % 100 == 0)
    {
      spdlog::info("tick {:4d}: {}", tick, patch);
      spdlog::info("tick {:4d}: {}", tick, contact);
      spdlog::info(
        "tick {:4d}: radius={:.4f} m wear={:.6e} surface={:.2f} core={:.2f}",
        tick,
        radius,
        output.wear,
        output.surfaceTemperature,
        output.coreTemperature);
    }
  }

  spdlog::info("final wear={:.6e} surface={:.2f} core={:.2f}",
               thermal.currentWear,
               thermal.surfaceTemperature,
               thermal.coreTemperature);
  return 0;
}
