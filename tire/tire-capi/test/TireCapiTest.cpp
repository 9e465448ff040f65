// Ticket: 0008_c_abi_boundary

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

#include "tire-capi/src/tire_capi.h"

namespace
{

void expectZeroAggregate(const tire_contact_aggregate_t& aggregate)
{
  EXPECT_EQ(aggregate.total_force.x, 0.0F);
  EXPECT_EQ(aggregate.total_force.y, 0.0F);
  EXPECT_EQ(aggregate.total_force.z, 0.0F);
  EXPECT_EQ(aggregate.total_torque.x, 0.0F);
  EXPECT_EQ(aggregate.total_torque.y, 0.0F);
  EXPECT_EQ(aggregate.total_torque.z, 0.0F);
  EXPECT_EQ(aggregate.average_position.x, 0.0F);
  EXPECT_EQ(aggregate.contact_area, 0.0F);
  EXPECT_EQ(aggregate.max_pressure, 0.0F);
  EXPECT_EQ(aggregate.weighted_grip, 0.0F);
}

}  // namespace

// ========== Conventions ==========

TEST(TireCapi, DefaultConventions_MatchBaseline)
{
  tire_conventions_t const conventions = tire_default_conventions();

  EXPECT_FLOAT_EQ(conventions.epsilon, 1.0e-6F);
  EXPECT_FLOAT_EQ(conventions.min_stiffness, 1.0e-4F);
  EXPECT_EQ(conventions.min_positive_weight, 0.0F);
  EXPECT_EQ(conventions.contact_penetration_threshold, 0.0F);
}

// ========== Normalizer ==========

TEST(TireCapi, NormalizeWeights_WritesDistribution)
{
  std::array<float, 3> const weights{1.0F, 1.0F, 2.0F};
  std::array<float, 3> out{-1.0F, -1.0F, -1.0F};

  EXPECT_EQ(tire_normalize_weights(
              weights.data(), weights.size(), nullptr, out.data()),
            TIRE_STATUS_OK);

  EXPECT_FLOAT_EQ(out[0], 0.25F);
  EXPECT_FLOAT_EQ(out[1], 0.25F);
  EXPECT_FLOAT_EQ(out[2], 0.5F);
}

TEST(TireCapi, NormalizeWeights_NullBuffers_Rejected)
{
  std::array<float, 2> buffer{1.0F, 1.0F};

  EXPECT_EQ(tire_normalize_weights(nullptr, 2, nullptr, buffer.data()),
            TIRE_STATUS_NULL_ARGUMENT);
  EXPECT_EQ(tire_normalize_weights(buffer.data(), 2, nullptr, nullptr),
            TIRE_STATUS_NULL_ARGUMENT);
  EXPECT_EQ(tire_normalize_weights(nullptr, 0, nullptr, nullptr),
            TIRE_STATUS_OK);
}

// ========== Patch ==========

TEST(TireCapi, AggregatePatch_HalfInContact)
{
  std::array<tire_patch_sample_t, 2> const samples{
    tire_patch_sample_t{1.0F, 0.02F, 0.1F, 0.0F},
    tire_patch_sample_t{1.0F, 0.00F, 0.2F, 0.1F}};

  tire_patch_aggregate_t const patch =
    tire_aggregate_patch(samples.data(), samples.size(), nullptr);

  EXPECT_NEAR(patch.contact_confidence, 0.5F, 1.0e-6F);
  EXPECT_FLOAT_EQ(patch.penetration_max, 0.02F);
  EXPECT_NEAR(patch.slip_x_avg, 0.15F, 1.0e-6F);
}

TEST(TireCapi, AggregatePatch_ConventionsOverride)
{
  tire_patch_sample_t const sample{1.0F, 0.02F, 0.0F, 0.0F};
  tire_conventions_t conventions = tire_default_conventions();
  conventions.contact_penetration_threshold = 0.03F;

  EXPECT_EQ(tire_aggregate_patch(&sample, 1, &conventions).contact_confidence,
            0.0F);
}

TEST(TireCapi, AggregatePatch_NullOrEmpty_ReturnsZero)
{
  tire_patch_aggregate_t const patch = tire_aggregate_patch(nullptr, 4, nullptr);

  EXPECT_EQ(patch.contact_confidence, 0.0F);
  EXPECT_EQ(patch.penetration_avg, 0.0F);
  EXPECT_EQ(patch.penetration_max, 0.0F);
  EXPECT_EQ(patch.slip_x_avg, 0.0F);
  EXPECT_EQ(patch.slip_y_avg, 0.0F);
}

// ========== Contacts ==========

TEST(TireCapi, AggregateContacts_NullPointBuffer_ReturnsZero)
{
  std::array<tire_vec3_t, 2> const normals{tire_vec3_t{1.0F, 0.0F, 0.0F},
                                           tire_vec3_t{1.0F, 0.0F, 0.0F}};
  std::array<float, 2> const forces{100.0F, 100.0F};
  std::array<float, 2> const grips{1.0F, 1.0F};

  expectZeroAggregate(tire_aggregate_contacts(nullptr,
                                              normals.data(),
                                              forces.data(),
                                              grips.data(),
                                              2,
                                              tire_vec3_t{0.0F, 0.0F, 0.0F},
                                              1000.0F));
}

TEST(TireCapi, AggregateContacts_ZeroCount_ReturnsZero)
{
  tire_vec3_t const point{0.0F, 0.0F, 0.0F};
  float const value{1.0F};

  expectZeroAggregate(tire_aggregate_contacts(
    &point, &point, &value, &value, 0, tire_vec3_t{0.0F, 0.0F, 0.0F}, 1.0F));
}

TEST(TireCapi, AggregateContacts_ComputesForceTorqueAndGrip)
{
  std::array<tire_vec3_t, 2> const points{tire_vec3_t{0.0F, 0.0F, 1.0F},
                                          tire_vec3_t{0.0F, 0.0F, -1.0F}};
  std::array<tire_vec3_t, 2> const normals{tire_vec3_t{1.0F, 0.0F, 0.0F},
                                           tire_vec3_t{1.0F, 0.0F, 0.0F}};
  std::array<float, 2> const forces{10.0F, 30.0F};
  std::array<float, 2> const grips{0.8F, 1.2F};

  tire_contact_aggregate_t const aggregate =
    tire_aggregate_contacts(points.data(),
                            normals.data(),
                            forces.data(),
                            grips.data(),
                            points.size(),
                            tire_vec3_t{0.0F, 0.0F, 0.0F},
                            20.0F);

  EXPECT_FLOAT_EQ(aggregate.total_force.x, 40.0F);
  EXPECT_FLOAT_EQ(aggregate.contact_area, 2.0F);
  EXPECT_FLOAT_EQ(aggregate.max_pressure, 30.0F);
  EXPECT_NEAR(aggregate.weighted_grip, 1.1F, 1.0e-6F);
  // (0,0,1) x (8,0,0) + (0,0,-1) x (36,0,0) = (0, 8 - 36, 0)
  EXPECT_NEAR(aggregate.total_torque.y, -28.0F, 1.0e-4F);
  EXPECT_FLOAT_EQ(aggregate.average_position.z, 0.0F);
}

// ========== Radius ==========

TEST(TireCapi, EffectiveRadius_IsBounded)
{
  float const r =
    tire_compute_effective_radius(0.34F, 0.27F, 4200.0F, 120000.0F, nullptr);

  EXPECT_GE(r, 0.27F);
  EXPECT_LE(r, 0.34F);
}

// ========== Wear / thermal ==========

TEST(TireCapi, StepWearAndTemperature_FeedsBack)
{
  tire_wear_thermal_input_t input{};
  input.slip_ratio = 0.1F;
  input.peak_pressure = 200000.0F;
  input.total_force_magnitude = 5000.0F;
  input.base_wear_rate = 1.0e-4F;
  input.base_heat_generation = 1.0F;
  input.cooling_rate = 0.05F;
  input.ambient_temperature = 25.0F;
  input.surface_temperature = 25.0F;
  input.core_temperature = 25.0F;
  input.delta_time = 0.1F;

  tire_wear_thermal_output_t output{};
  for (int tick = 0; tick < 10; ++tick)
  {
    output = tire_step_wear_and_temperature(&input);
    input.current_wear = output.wear;
    input.surface_temperature = output.surface_temperature;
    input.core_temperature = output.core_temperature;
  }

  EXPECT_GT(output.wear, 0.0F);
  EXPECT_LE(output.wear, 1.0F);
  EXPECT_GT(output.surface_temperature, 25.0F);
  EXPECT_GT(output.core_temperature, 25.0F);
}

TEST(TireCapi, StepWearAndTemperature_NaNWearReset)
{
  tire_wear_thermal_input_t input{};
  input.current_wear = std::numeric_limits<float>::quiet_NaN();
  input.delta_time = 0.1F;

  EXPECT_EQ(tire_step_wear_and_temperature(&input).wear, 0.0F);
}

TEST(TireCapi, StepWearAndTemperature_NullInput_ReturnsZero)
{
  tire_wear_thermal_output_t const output =
    tire_step_wear_and_temperature(nullptr);

  EXPECT_EQ(output.wear, 0.0F);
  EXPECT_EQ(output.surface_temperature, 0.0F);
  EXPECT_EQ(output.core_temperature, 0.0F);
}
