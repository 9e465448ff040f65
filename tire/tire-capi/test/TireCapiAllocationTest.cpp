// Ticket: 0008_c_abi_boundary

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <new>

#include "tire-capi/src/tire_capi.h"

namespace
{

std::atomic<std::size_t> allocationCount{0};

// Counts heap allocations made between two reads of allocationCount
class AllocationCounter
{
public:
  AllocationCounter()
    : start_{allocationCount.load()}
  {
  }

  [[nodiscard]] std::size_t count() const
  {
    return allocationCount.load() - start_;
  }

private:
  std::size_t start_;
};

}  // namespace

void* operator new(std::size_t size)
{
  allocationCount.fetch_add(1);
  if (void* p = std::malloc(size == 0 ? 1 : size))
  {
    return p;
  }
  throw std::bad_alloc{};
}

void operator delete(void* p) noexcept
{
  std::free(p);
}

void operator delete(void* p, std::size_t) noexcept
{
  std::free(p);
}

TEST(TireCapiAllocation, AggregateContacts_DoesNotAllocate)
{
  std::array<tire_vec3_t, 4> const points{tire_vec3_t{-0.3F, -0.06F, 0.05F},
                                          tire_vec3_t{-0.3F, 0.06F, 0.05F},
                                          tire_vec3_t{-0.3F, -0.06F, -0.05F},
                                          tire_vec3_t{-0.3F, 0.06F, -0.05F}};
  std::array<tire_vec3_t, 4> const normals{tire_vec3_t{1.0F, 0.0F, 0.0F},
                                           tire_vec3_t{1.0F, 0.0F, 0.0F},
                                           tire_vec3_t{1.0F, 0.02F, 0.0F},
                                           tire_vec3_t{1.0F, 0.02F, 0.0F}};
  std::array<float, 4> const forces{1000.0F, 1100.0F, 1050.0F, 1050.0F};
  std::array<float, 4> const grips{1.0F, 1.0F, 0.95F, 0.95F};

  AllocationCounter const counter;
  tire_contact_aggregate_t const aggregate =
    tire_aggregate_contacts(points.data(),
                            normals.data(),
                            forces.data(),
                            grips.data(),
                            points.size(),
                            tire_vec3_t{0.0F, 0.0F, 0.0F},
                            20000.0F);
  std::size_t const allocations = counter.count();

  EXPECT_EQ(allocations, 0U);
  EXPECT_FLOAT_EQ(aggregate.max_pressure, 1100.0F);
}

TEST(TireCapiAllocation, AggregatePatch_AllocatesOnlyNormalizedWeights)
{
  std::array<tire_patch_sample_t, 4> const samples{
    tire_patch_sample_t{1.0F, 0.01F, 0.1F, 0.0F},
    tire_patch_sample_t{1.0F, 0.0F, 0.1F, 0.0F},
    tire_patch_sample_t{2.0F, 0.02F, 0.2F, 0.0F},
    tire_patch_sample_t{0.0F, 0.03F, 0.0F, 0.0F}};

  AllocationCounter const counter;
  tire_patch_aggregate_t const patch =
    tire_aggregate_patch(samples.data(), samples.size(), nullptr);
  std::size_t const allocations = counter.count();

  EXPECT_EQ(allocations, 1U);
  EXPECT_FLOAT_EQ(patch.contact_confidence, 0.75F);
}

TEST(TireCapiAllocation, StepWearAndTemperature_DoesNotAllocate)
{
  tire_wear_thermal_input_t const input{0.1F,
                                        0.05F,
                                        10000.0F,
                                        10000.0F,
                                        0.2F,
                                        0.001F,
                                        10.0F,
                                        0.1F,
                                        20.0F,
                                        60.0F,
                                        50.0F,
                                        0.01F};

  AllocationCounter const counter;
  tire_wear_thermal_output_t const output =
    tire_step_wear_and_temperature(&input);
  std::size_t const allocations = counter.count();

  EXPECT_EQ(allocations, 0U);
  EXPECT_GT(output.wear, 0.2F);
}
