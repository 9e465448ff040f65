// Ticket: 0005_contact_force_aggregation

#include <benchmark/benchmark.h>
#include <cstddef>
#include <random>
#include <vector>

#include "tire-core/src/Contact/ContactAggregator.hpp"

using namespace tire_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Contact points scattered over a 0.2 m x 0.15 m footprint, fixed seed
std::vector<ContactPoint> generateFootprint(std::size_t count)
{
  static std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<float> longitudinal{-0.1F, 0.1F};
  std::uniform_real_distribution<float> lateral{-0.075F, 0.075F};
  std::uniform_real_distribution<float> tilt{-0.05F, 0.05F};
  std::uniform_real_distribution<float> load{200.0F, 800.0F};
  std::uniform_real_distribution<float> grip{0.8F, 1.1F};

  std::vector<ContactPoint> contacts;
  contacts.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    Vector3F const normal =
      Vector3F{1.0F, tilt(rng), tilt(rng)}.normalized();
    contacts.push_back(
      ContactPoint{Coordinate{-0.31F, lateral(rng), longitudinal(rng)},
                   normal,
                   load(rng),
                   grip(rng)});
  }
  return contacts;
}

}  // namespace

// ============================================================================
// Contact aggregation
// ============================================================================

/**
 * @brief Benchmark force/torque aggregation over a contact footprint.
 *
 * Typical footprints carry 4-64 contacts per tick; the larger sizes cover
 * dense terrain meshes.
 *
 * @ticket 0005_contact_force_aggregation
 */
static void BM_AggregateContacts(benchmark::State& state)
{
  auto const count = static_cast<std::size_t>(state.range(0));
  auto const contacts = generateFootprint(count);
  Coordinate const origin{0.0F, 0.0F, 0.0F};

  for (auto _ : state)
  {
    auto result = aggregateContacts(contacts, origin, 120000.0F);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_AggregateContacts)
  ->Arg(4)
  ->Arg(16)
  ->Arg(64)
  ->Arg(256)
  ->Arg(1024)
  ->Complexity(benchmark::oN);
