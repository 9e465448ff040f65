// Ticket: 0008_c_abi_boundary

#include "tire-capi/src/tire_capi.h"

#include <algorithm>
#include <cstddef>
#include <new>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "tire-core/src/Contact/ContactAggregator.hpp"
#include "tire-core/src/Conventions/TireConventions.hpp"
#include "tire-core/src/Patch/PatchAggregator.hpp"
#include "tire-core/src/Patch/WeightNormalizer.hpp"
#include "tire-core/src/Radius/EffectiveRadius.hpp"
#include "tire-core/src/Thermal/WearThermalStepper.hpp"
#include "tire-transfer/src/Records.hpp"

// The C records mirror the flat transfer records field for field
static_assert(sizeof(tire_vec3_t) == sizeof(tire_transfer::Vector3FRecord));
static_assert(sizeof(tire_conventions_t) ==
              sizeof(tire_transfer::TireConventionsRecord));
static_assert(sizeof(tire_patch_sample_t) ==
              sizeof(tire_transfer::PatchSampleRecord));
static_assert(sizeof(tire_patch_aggregate_t) ==
              sizeof(tire_transfer::PatchAggregateRecord));
static_assert(sizeof(tire_contact_aggregate_t) ==
              sizeof(tire_transfer::ContactAggregateRecord));
static_assert(offsetof(tire_contact_aggregate_t, contact_area) ==
              offsetof(tire_transfer::ContactAggregateRecord, contact_area));
static_assert(sizeof(tire_wear_thermal_input_t) ==
              sizeof(tire_transfer::WearThermalInputRecord));
static_assert(offsetof(tire_wear_thermal_input_t, delta_time) ==
              offsetof(tire_transfer::WearThermalInputRecord, delta_time));
static_assert(sizeof(tire_wear_thermal_output_t) ==
              sizeof(tire_transfer::WearThermalOutputRecord));

namespace
{

tire_core::TireConventions toConventions(const tire_conventions_t* conventions)
{
  if (conventions == nullptr)
  {
    return tire_core::TireConventions{};
  }
  tire_transfer::TireConventionsRecord record;
  record.epsilon = conventions->epsilon;
  record.min_stiffness = conventions->min_stiffness;
  record.min_positive_weight = conventions->min_positive_weight;
  record.contact_penetration_threshold =
    conventions->contact_penetration_threshold;
  return tire_core::TireConventions::fromRecord(record);
}

tire_vec3_t toC(const tire_transfer::Vector3FRecord& record)
{
  return tire_vec3_t{record.x, record.y, record.z};
}

tire_core::Coordinate toCoordinate(const tire_vec3_t& v)
{
  return tire_core::Coordinate{v.x, v.y, v.z};
}

tire_patch_aggregate_t toC(const tire_core::PatchAggregate& patch)
{
  auto const record = patch.toRecord();
  return tire_patch_aggregate_t{record.contact_confidence,
                                record.penetration_avg,
                                record.penetration_max,
                                record.slip_x_avg,
                                record.slip_y_avg};
}

tire_contact_aggregate_t toC(const tire_core::ContactAggregate& contact)
{
  auto const record = contact.toRecord();
  return tire_contact_aggregate_t{toC(record.total_force),
                                  toC(record.total_torque),
                                  toC(record.average_position),
                                  record.contact_area,
                                  record.max_pressure,
                                  record.weighted_grip};
}

}  // namespace

extern "C" tire_conventions_t tire_default_conventions(void)
{
  auto const record = tire_core::TireConventions{}.toRecord();
  return tire_conventions_t{record.epsilon,
                            record.min_stiffness,
                            record.min_positive_weight,
                            record.contact_penetration_threshold};
}

extern "C" tire_status_t tire_normalize_weights(
  const float* weights,
  size_t count,
  const tire_conventions_t* conventions,
  float* out)
{
  if (count == 0)
  {
    return TIRE_STATUS_OK;
  }
  if (weights == nullptr || out == nullptr)
  {
    return TIRE_STATUS_NULL_ARGUMENT;
  }

  try
  {
    std::vector<float> const normalized = tire_core::normalizeWeights(
      std::span<const float>{weights, count}, toConventions(conventions));
    std::copy(normalized.begin(), normalized.end(), out);
  }
  catch (const std::bad_alloc& e)
  {
    spdlog::error("tire_normalize_weights: {} ({} weights)", e.what(), count);
    return TIRE_STATUS_OUT_OF_MEMORY;
  }
  return TIRE_STATUS_OK;
}

extern "C" tire_patch_aggregate_t tire_aggregate_patch(
  const tire_patch_sample_t* samples,
  size_t count,
  const tire_conventions_t* conventions)
{
  if (samples == nullptr || count == 0)
  {
    return toC(tire_core::PatchAggregate{});
  }

  try
  {
    return toC(tire_core::detail::accumulatePatch(
      count,
      [&](std::size_t i)
      {
        return tire_core::PatchSample{samples[i].weight,
                                      samples[i].penetration,
                                      samples[i].slip_x,
                                      samples[i].slip_y};
      },
      toConventions(conventions)));
  }
  catch (const std::bad_alloc& e)
  {
    spdlog::error("tire_aggregate_patch: {} ({} samples)", e.what(), count);
    return toC(tire_core::PatchAggregate{});
  }
}

extern "C" tire_contact_aggregate_t tire_aggregate_contacts(
  const tire_vec3_t* points,
  const tire_vec3_t* normals,
  const float* forces,
  const float* grips,
  size_t count,
  tire_vec3_t origin,
  float stiffness)
{
  if (points == nullptr || normals == nullptr || forces == nullptr ||
      grips == nullptr || count == 0)
  {
    return toC(tire_core::ContactAggregate{});
  }

  // Reads the caller's arrays in place; no allocation
  return toC(tire_core::detail::accumulateContacts(
    count,
    [&](std::size_t i)
    {
      return tire_core::ContactPoint{
        toCoordinate(points[i]),
        tire_core::Vector3F{normals[i].x, normals[i].y, normals[i].z},
        forces[i],
        grips[i]};
    },
    toCoordinate(origin),
    stiffness));
}

extern "C" float tire_compute_effective_radius(
  float tire_radius,
  float min_effective_radius,
  float vertical_load,
  float stiffness,
  const tire_conventions_t* conventions)
{
  return tire_core::computeEffectiveRadius(tire_radius,
                                           min_effective_radius,
                                           vertical_load,
                                           stiffness,
                                           toConventions(conventions));
}

extern "C" tire_wear_thermal_output_t tire_step_wear_and_temperature(
  const tire_wear_thermal_input_t* input)
{
  if (input == nullptr)
  {
    return tire_wear_thermal_output_t{0.0F, 0.0F, 0.0F};
  }

  tire_transfer::WearThermalInputRecord record;
  record.slip_ratio = input->slip_ratio;
  record.slip_angle = input->slip_angle;
  record.peak_pressure = input->peak_pressure;
  record.total_force_magnitude = input->total_force_magnitude;
  record.current_wear = input->current_wear;
  record.base_wear_rate = input->base_wear_rate;
  record.base_heat_generation = input->base_heat_generation;
  record.cooling_rate = input->cooling_rate;
  record.ambient_temperature = input->ambient_temperature;
  record.surface_temperature = input->surface_temperature;
  record.core_temperature = input->core_temperature;
  record.delta_time = input->delta_time;

  auto const output = tire_core::stepWearAndTemperature(
                        tire_core::WearThermalInput::fromRecord(record))
                        .toRecord();
  return tire_wear_thermal_output_t{
    output.wear, output.surface_temperature, output.core_temperature};
}
