// Ticket: 0003_tuning_conventions

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "tire-core/src/Conventions/TireConventions.hpp"

namespace tire_core
{
namespace test
{

TEST(TireConventions, Defaults_MatchBaseline)
{
  TireConventions const conventions{};

  EXPECT_FLOAT_EQ(conventions.epsilon, 1.0e-6F);
  EXPECT_FLOAT_EQ(conventions.minStiffness, 1.0e-4F);
  EXPECT_EQ(conventions.minPositiveWeight, 0.0F);
  EXPECT_EQ(conventions.contactPenetrationThreshold, 0.0F);
}

TEST(TireConventions, DefaultRecord_MatchesDefaultConventions)
{
  auto const conventions =
    TireConventions::fromRecord(tire_transfer::TireConventionsRecord{});

  EXPECT_EQ(conventions.epsilon, TireConventions{}.epsilon);
  EXPECT_EQ(conventions.minStiffness, TireConventions{}.minStiffness);
}

TEST(TireConventions, Record_PreservesAllFields)
{
  TireConventions const original{2.0e-6F, 5.0e-3F, 0.1F, 0.004F};

  auto const restored = TireConventions::fromRecord(original.toRecord());

  EXPECT_EQ(restored.epsilon, original.epsilon);
  EXPECT_EQ(restored.minStiffness, original.minStiffness);
  EXPECT_EQ(restored.minPositiveWeight, original.minPositiveWeight);
  EXPECT_EQ(restored.contactPenetrationThreshold,
            original.contactPenetrationThreshold);
}

TEST(TireConventions, SetEpsilon_RejectsNegative)
{
  TireConventions conventions{};
  EXPECT_THROW(conventions.setEpsilon(-1.0F), std::invalid_argument);
  EXPECT_FLOAT_EQ(conventions.epsilon, 1.0e-6F);
}

TEST(TireConventions, SetMinStiffness_RejectsZeroAndNaN)
{
  TireConventions conventions{};
  EXPECT_THROW(conventions.setMinStiffness(0.0F), std::invalid_argument);
  EXPECT_THROW(
    conventions.setMinStiffness(std::numeric_limits<float>::quiet_NaN()),
    std::invalid_argument);

  conventions.setMinStiffness(2.0F);
  EXPECT_EQ(conventions.minStiffness, 2.0F);
}

TEST(TireConventions, SetContactPenetrationThreshold_AllowsNegative)
{
  TireConventions conventions{};
  conventions.setContactPenetrationThreshold(-0.01F);
  EXPECT_EQ(conventions.contactPenetrationThreshold, -0.01F);

  EXPECT_THROW(conventions.setContactPenetrationThreshold(
                 std::numeric_limits<float>::infinity()),
               std::invalid_argument);
}

TEST(TireConventions, SetMinPositiveWeight_RejectsInfinity)
{
  TireConventions conventions{};
  EXPECT_THROW(
    conventions.setMinPositiveWeight(std::numeric_limits<float>::infinity()),
    std::invalid_argument);
  conventions.setMinPositiveWeight(0.25F);
  EXPECT_EQ(conventions.minPositiveWeight, 0.25F);
}

}  // namespace test
}  // namespace tire_core
