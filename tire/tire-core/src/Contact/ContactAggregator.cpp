// Ticket: 0005_contact_force_aggregation

#include "tire-core/src/Contact/ContactAggregator.hpp"

#include <spdlog/spdlog.h>

namespace tire_core
{

// ========== ContactAggregate ==========

ContactAggregate ContactAggregate::fromRecord(
  const tire_transfer::ContactAggregateRecord& record)
{
  ContactAggregate result;
  result.totalForce = ForceVector::fromRecord(record.total_force);
  result.totalTorque = TorqueVector::fromRecord(record.total_torque);
  result.averagePosition = Coordinate::fromRecord(record.average_position);
  result.contactArea = record.contact_area;
  result.maxPressure = record.max_pressure;
  result.weightedGrip = record.weighted_grip;
  return result;
}

tire_transfer::ContactAggregateRecord ContactAggregate::toRecord() const
{
  tire_transfer::ContactAggregateRecord record;
  record.total_force = totalForce.toRecord();
  record.total_torque = totalTorque.toRecord();
  record.average_position = averagePosition.toRecord();
  record.contact_area = contactArea;
  record.max_pressure = maxPressure;
  record.weighted_grip = weightedGrip;
  return record;
}

// ========== Aggregation ==========

std::optional<ContactAggregate> tryAggregateContacts(const Coordinate* points,
                                                     const Vector3F* normals,
                                                     const float* normalForces,
                                                     const float* grips,
                                                     std::size_t count,
                                                     const Coordinate& origin,
                                                     float stiffness)
{
  if (points == nullptr || normals == nullptr || normalForces == nullptr ||
      grips == nullptr || count == 0)
  {
    return std::nullopt;
  }

  return detail::accumulateContacts(
    count,
    [&](std::size_t i)
    {
      return ContactPoint{points[i], normals[i], normalForces[i], grips[i]};
    },
    origin,
    stiffness);
}

std::optional<ContactAggregate> tryAggregateContacts(
  std::span<const ContactPoint> contacts,
  const Coordinate& origin,
  float stiffness)
{
  if (contacts.empty())
  {
    return std::nullopt;
  }

  return detail::accumulateContacts(
    contacts.size(),
    [&](std::size_t i) { return contacts[i]; },
    origin,
    stiffness);
}

ContactAggregate aggregateContacts(const Coordinate* points,
                                   const Vector3F* normals,
                                   const float* normalForces,
                                   const float* grips,
                                   std::size_t count,
                                   const Coordinate& origin,
                                   float stiffness)
{
  auto result = tryAggregateContacts(
    points, normals, normalForces, grips, count, origin, stiffness);
  if (!result.has_value())
  {
    spdlog::debug(
      "aggregateContacts: missing contact buffer or zero count ({}), "
      "returning zero aggregate",
      count);
    return ContactAggregate{};
  }
  return *result;
}

ContactAggregate aggregateContacts(std::span<const ContactPoint> contacts,
                                   const Coordinate& origin,
                                   float stiffness)
{
  auto result = tryAggregateContacts(contacts, origin, stiffness);
  if (!result.has_value())
  {
    spdlog::debug("aggregateContacts: no contacts, returning zero aggregate");
    return ContactAggregate{};
  }
  return *result;
}

}  // namespace tire_core
