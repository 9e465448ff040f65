// Ticket: 0005_contact_force_aggregation

#ifndef TIRE_CORE_CONTACT_CONTACT_AGGREGATOR_HPP
#define TIRE_CORE_CONTACT_CONTACT_AGGREGATOR_HPP

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>

#include "tire-core/src/DataTypes/VectorTypes.hpp"
#include "tire-transfer/src/ContactAggregateRecord.hpp"

namespace tire_core
{

/**
 * @brief One discrete tire/road contact location.
 */
struct ContactPoint
{
  Coordinate position;   // World space [m]
  Vector3F normal;       // Surface normal
  float normalForce{0.0F};  // [N]
  float grip{0.0F};         // Dimensionless grip coefficient
};

/**
 * @brief Force/torque summary of a contact point set about an origin.
 */
struct ContactAggregate
{
  ForceVector totalForce;         // [N]
  TorqueVector totalTorque;       // [N*m], about the caller's origin
  Coordinate averagePosition;     // Unweighted centroid [m]
  float contactArea{0.0F};
  float maxPressure{0.0F};        // Largest single normal force [N]
  float weightedGrip{0.0F};

  static ContactAggregate fromRecord(
    const tire_transfer::ContactAggregateRecord& record);

  [[nodiscard]] tire_transfer::ContactAggregateRecord toRecord() const;
};

/**
 * @brief Aggregate parallel contact arrays into force, torque and grip.
 *
 * Two passes over the contacts:
 * 1. Per contact, force = normal * normalForce with the y and z components
 *    (the shear plane) additionally scaled by grip; x, the normal's first
 *    axis, carries the vertical load and is not grip-scaled. Accumulates
 *    total force, the position centroid, contact area
 *    (normalForce / max(stiffness, 1)) and the peak normal force.
 * 2. Per contact, torque += (position - origin) x (normal * normalForce * grip).
 *
 * weightedGrip is sum(grip_i * normalForce_i / |totalForce|), or 1 when
 * |totalForce| is 0. It is not renormalized and can exceed 1.
 *
 * Any null array or count == 0 yields an all-zero aggregate. The arrays must
 * each hold at least count elements.
 *
 * @param points Contact positions
 * @param normals Contact normals
 * @param normalForces Normal force magnitude per contact [N]
 * @param grips Grip coefficient per contact
 * @param count Number of contacts
 * @param origin Reference point for the torque
 * @param stiffness Contact-area divisor (floored at 1)
 * @return The aggregate
 *
 * @ticket 0005_contact_force_aggregation
 */
[[nodiscard]] ContactAggregate aggregateContacts(const Coordinate* points,
                                                 const Vector3F* normals,
                                                 const float* normalForces,
                                                 const float* grips,
                                                 std::size_t count,
                                                 const Coordinate& origin,
                                                 float stiffness);

/**
 * @brief Aggregate contact points held as an array of structures.
 *
 * Same algorithm as the parallel-array overload. An empty span yields an
 * all-zero aggregate.
 */
[[nodiscard]] ContactAggregate aggregateContacts(
  std::span<const ContactPoint> contacts,
  const Coordinate& origin,
  float stiffness);

/**
 * @brief Parallel-array aggregation that distinguishes degenerate input.
 *
 * @return std::nullopt for a null array or count == 0, otherwise the value
 *         aggregateContacts() returns
 */
[[nodiscard]] std::optional<ContactAggregate> tryAggregateContacts(
  const Coordinate* points,
  const Vector3F* normals,
  const float* normalForces,
  const float* grips,
  std::size_t count,
  const Coordinate& origin,
  float stiffness);

[[nodiscard]] std::optional<ContactAggregate> tryAggregateContacts(
  std::span<const ContactPoint> contacts,
  const Coordinate& origin,
  float stiffness);

namespace detail
{

/**
 * @brief Both aggregation passes over any indexed contact source.
 *
 * contactAt(i) returns the i-th ContactPoint; count must be > 0. Does not
 * allocate, so callers holding contacts in their own layout can aggregate
 * without staging them into ContactPoint arrays.
 */
template <typename ContactAt>
[[nodiscard]] ContactAggregate accumulateContacts(std::size_t count,
                                                  ContactAt&& contactAt,
                                                  const Coordinate& origin,
                                                  float stiffness)
{
  ContactAggregate result{};
  float const areaDivisor = std::max(stiffness, 1.0F);

  // Pass 1: force, centroid, area, peak pressure
  Coordinate centroid{};
  for (std::size_t i = 0; i < count; ++i)
  {
    ContactPoint const contact = contactAt(i);
    float const f = contact.normalForce;
    float const g = contact.grip;

    // Grip attenuates the shear plane only; x carries the vertical load
    ForceVector const force{contact.normal.x() * f,
                            contact.normal.y() * f * g,
                            contact.normal.z() * f * g};

    result.totalForce += force;
    centroid += contact.position;
    result.contactArea += f / areaDivisor;
    result.maxPressure = std::max(result.maxPressure, f);
  }

  result.averagePosition = centroid / static_cast<float>(count);

  // Pass 2: torque about the origin
  for (std::size_t i = 0; i < count; ++i)
  {
    ContactPoint const contact = contactAt(i);
    Vector3F const leverArm = contact.position - origin;
    ForceVector const shear =
      contact.normal * (contact.normalForce * contact.grip);
    result.totalTorque += leverArm.cross(shear);
  }

  float const forceMagnitude = result.totalForce.length();
  if (forceMagnitude == 0.0F)
  {
    result.weightedGrip = 1.0F;
  }
  else
  {
    float weightedGrip{0.0F};
    for (std::size_t i = 0; i < count; ++i)
    {
      ContactPoint const contact = contactAt(i);
      weightedGrip += contact.grip * (contact.normalForce / forceMagnitude);
    }
    result.weightedGrip = weightedGrip;
  }

  return result;
}

}  // namespace detail

}  // namespace tire_core

template <>
struct fmt::formatter<tire_core::ContactAggregate>
{
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tire_core::ContactAggregate& contact,
              FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "ContactAggregate{{force={:.3f}, torque={:.3f}, "
                          "centroid={:.4f}, area={:.6f}, maxPressure={:.3f}, "
                          "grip={:.4f}}}",
                          contact.totalForce,
                          contact.totalTorque,
                          contact.averagePosition,
                          contact.contactArea,
                          contact.maxPressure,
                          contact.weightedGrip);
  }
};

#endif  // TIRE_CORE_CONTACT_CONTACT_AGGREGATOR_HPP
