// Ticket: 0006_effective_rolling_radius

#ifndef TIRE_CORE_RADIUS_EFFECTIVE_RADIUS_HPP
#define TIRE_CORE_RADIUS_EFFECTIVE_RADIUS_HPP

#include "tire-core/src/Conventions/TireConventions.hpp"

namespace tire_core
{

/**
 * @brief Compressed rolling radius under a vertical load.
 *
 * compression = min(max(load, 0) / max(stiffness, minStiffness), tireRadius)
 * result = clamp(tireRadius - compression, minEffectiveRadius, tireRadius)
 *
 * Returns 0 when tireRadius <= 0. For tireRadius > minEffectiveRadius >= 0
 * the result always lies in [minEffectiveRadius, tireRadius].
 *
 * @param tireRadius Unloaded radius [m]
 * @param minEffectiveRadius Radius floor, e.g. the rim [m]
 * @param verticalLoad Load on the tire [N]; negative loads compress nothing
 * @param stiffness Radial stiffness [N/m]
 * @param conventions Numerical conventions (read-only)
 * @return Effective radius [m]
 *
 * @ticket 0006_effective_rolling_radius
 */
[[nodiscard]] float computeEffectiveRadius(
  float tireRadius,
  float minEffectiveRadius,
  float verticalLoad,
  float stiffness,
  const TireConventions& conventions = TireConventions{});

}  // namespace tire_core

#endif  // TIRE_CORE_RADIUS_EFFECTIVE_RADIUS_HPP
