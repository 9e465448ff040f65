// Ticket: 0001_flat_tire_records

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>

#include "tire-transfer/src/Records.hpp"

namespace tire_transfer
{
namespace test
{

// Field order is part of the cross-boundary contract

TEST(RecordLayout, ContactAggregate_FieldOrder)
{
  EXPECT_EQ(offsetof(ContactAggregateRecord, total_force), 0U);
  EXPECT_EQ(offsetof(ContactAggregateRecord, total_torque), 3 * sizeof(float));
  EXPECT_EQ(offsetof(ContactAggregateRecord, average_position),
            6 * sizeof(float));
  EXPECT_EQ(offsetof(ContactAggregateRecord, contact_area), 9 * sizeof(float));
  EXPECT_EQ(offsetof(ContactAggregateRecord, max_pressure), 10 * sizeof(float));
  EXPECT_EQ(offsetof(ContactAggregateRecord, weighted_grip),
            11 * sizeof(float));
}

TEST(RecordLayout, PatchAggregate_FieldOrder)
{
  EXPECT_EQ(offsetof(PatchAggregateRecord, contact_confidence), 0U);
  EXPECT_EQ(offsetof(PatchAggregateRecord, penetration_avg), sizeof(float));
  EXPECT_EQ(offsetof(PatchAggregateRecord, penetration_max),
            2 * sizeof(float));
  EXPECT_EQ(offsetof(PatchAggregateRecord, slip_x_avg), 3 * sizeof(float));
  EXPECT_EQ(offsetof(PatchAggregateRecord, slip_y_avg), 4 * sizeof(float));
}

TEST(RecordLayout, WearThermalInput_FieldOrder)
{
  EXPECT_EQ(offsetof(WearThermalInputRecord, slip_ratio), 0U);
  EXPECT_EQ(offsetof(WearThermalInputRecord, current_wear), 4 * sizeof(float));
  EXPECT_EQ(offsetof(WearThermalInputRecord, ambient_temperature),
            8 * sizeof(float));
  EXPECT_EQ(offsetof(WearThermalInputRecord, delta_time), 11 * sizeof(float));
}

TEST(RecordLayout, ResultRecords_DefaultToNaN)
{
  PatchAggregateRecord const patch{};
  ContactAggregateRecord const contact{};
  WearThermalOutputRecord const output{};

  EXPECT_TRUE(std::isnan(patch.contact_confidence));
  EXPECT_TRUE(std::isnan(contact.total_force.x));
  EXPECT_TRUE(std::isnan(contact.weighted_grip));
  EXPECT_TRUE(std::isnan(output.wear));
}

TEST(RecordLayout, ConfigurationRecords_DefaultToBaseline)
{
  TireConventionsRecord const conventions{};
  WearThermalModelRecord const model{};

  EXPECT_FLOAT_EQ(conventions.epsilon, 1.0e-6F);
  EXPECT_FLOAT_EQ(conventions.min_stiffness, 1.0e-4F);
  EXPECT_EQ(conventions.min_positive_weight, 0.0F);
  EXPECT_EQ(conventions.contact_penetration_threshold, 0.0F);
  EXPECT_EQ(model.wear_slip_ratio_gain, 5.0F);
  EXPECT_EQ(model.surface_heat_share, 0.7F);
}

}  // namespace test
}  // namespace tire_transfer
