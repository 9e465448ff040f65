// Ticket: 0006_effective_rolling_radius

#include "tire-core/src/Radius/EffectiveRadius.hpp"

#include <algorithm>

namespace tire_core
{

float computeEffectiveRadius(float tireRadius,
                             float minEffectiveRadius,
                             float verticalLoad,
                             float stiffness,
                             const TireConventions& conventions)
{
  if (tireRadius <= 0.0F)
  {
    return 0.0F;
  }

  float const safeStiffness = std::max(stiffness, conventions.minStiffness);
  float const compression =
    std::min(std::max(verticalLoad, 0.0F) / safeStiffness, tireRadius);

  // minEffectiveRadius may exceed tireRadius, which std::clamp forbids
  return std::min(std::max(tireRadius - compression, minEffectiveRadius),
                  tireRadius);
}

}  // namespace tire_core
