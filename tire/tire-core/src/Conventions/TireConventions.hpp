// Ticket: 0003_tuning_conventions

#ifndef TIRE_CORE_CONVENTIONS_TIRE_CONVENTIONS_HPP
#define TIRE_CORE_CONVENTIONS_TIRE_CONVENTIONS_HPP

#include <cmath>
#include <stdexcept>
#include <string>

#include "tire-transfer/src/TireConventionsRecord.hpp"

namespace tire_core
{

/**
 * @brief Numerical tuning conventions shared by the patch computations.
 *
 * Every computation takes the conventions by const reference and never
 * mutates them. Fields are public so callers can aggregate-initialize a
 * bundle; the setters validate and are the preferred way to change a value
 * coming from external configuration.
 *
 * @ticket 0003_tuning_conventions
 */
struct TireConventions
{
  float epsilon{1.0e-6F};                     ///< Degenerate-sum threshold
  float minStiffness{1.0e-4F};                ///< Stiffness floor [N/m]
  float minPositiveWeight{0.0F};              ///< Weights <= this are dropped
  float contactPenetrationThreshold{0.0F};    ///< In contact above this [m]

  /**
   * @brief Set the degenerate-sum threshold.
   *
   * @param value Threshold [0, inf)
   * @throws std::invalid_argument if value is negative or not finite
   */
  void setEpsilon(float value)
  {
    requireNonNegative("epsilon", value);
    epsilon = value;
  }

  /**
   * @brief Set the stiffness floor.
   *
   * @param value Floor [N/m], must be > 0
   * @throws std::invalid_argument if value is not strictly positive and finite
   */
  void setMinStiffness(float value)
  {
    if (!std::isfinite(value) || value <= 0.0F)
    {
      throw std::invalid_argument(
        "TireConventions: minStiffness must be positive and finite, got: " +
        std::to_string(value));
    }
    minStiffness = value;
  }

  void setMinPositiveWeight(float value)
  {
    requireNonNegative("minPositiveWeight", value);
    minPositiveWeight = value;
  }

  void setContactPenetrationThreshold(float value)
  {
    if (!std::isfinite(value))
    {
      throw std::invalid_argument(
        "TireConventions: contactPenetrationThreshold must be finite, got: " +
        std::to_string(value));
    }
    contactPenetrationThreshold = value;
  }

  static TireConventions fromRecord(
    const tire_transfer::TireConventionsRecord& record)
  {
    return TireConventions{record.epsilon,
                           record.min_stiffness,
                           record.min_positive_weight,
                           record.contact_penetration_threshold};
  }

  [[nodiscard]] tire_transfer::TireConventionsRecord toRecord() const
  {
    tire_transfer::TireConventionsRecord record;
    record.epsilon = epsilon;
    record.min_stiffness = minStiffness;
    record.min_positive_weight = minPositiveWeight;
    record.contact_penetration_threshold = contactPenetrationThreshold;
    return record;
  }

private:
  static void requireNonNegative(const char* name, float value)
  {
    if (!std::isfinite(value) || value < 0.0F)
    {
      throw std::invalid_argument(std::string{"TireConventions: "} + name +
                                  " must be non-negative and finite, got: " +
                                  std::to_string(value));
    }
  }
};

}  // namespace tire_core

#endif  // TIRE_CORE_CONVENTIONS_TIRE_CONVENTIONS_HPP
