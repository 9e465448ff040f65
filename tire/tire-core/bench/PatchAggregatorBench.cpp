// Ticket: 0004_patch_statistics

#include <benchmark/benchmark.h>
#include <cstddef>
#include <random>
#include <vector>

#include "tire-core/src/Patch/PatchAggregator.hpp"
#include "tire-core/src/Patch/WeightNormalizer.hpp"

using namespace tire_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

std::vector<PatchSample> generateSamples(std::size_t count)
{
  static std::mt19937 rng{7};
  std::uniform_real_distribution<float> weight{0.0F, 1.0F};
  std::uniform_real_distribution<float> penetration{-0.002F, 0.02F};
  std::uniform_real_distribution<float> slip{-0.2F, 0.2F};

  std::vector<PatchSample> samples;
  samples.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    samples.push_back(
      PatchSample{weight(rng), penetration(rng), slip(rng), slip(rng)});
  }
  return samples;
}

}  // namespace

// ============================================================================
// Statistical patch aggregation
// ============================================================================

/**
 * @brief Benchmark confidence and weighted-average aggregation.
 *
 * @ticket 0004_patch_statistics
 */
static void BM_AggregatePatch(benchmark::State& state)
{
  auto const count = static_cast<std::size_t>(state.range(0));
  auto const samples = generateSamples(count);

  for (auto _ : state)
  {
    auto result = aggregatePatch(samples);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_AggregatePatch)
  ->Arg(4)
  ->Arg(64)
  ->Arg(1024)
  ->Complexity(benchmark::oN);

static void BM_NormalizeWeights(benchmark::State& state)
{
  auto const count = static_cast<std::size_t>(state.range(0));
  auto const samples = generateSamples(count);
  std::vector<float> weights;
  weights.reserve(count);
  for (const auto& sample : samples)
  {
    weights.push_back(sample.weight);
  }

  for (auto _ : state)
  {
    auto result = normalizeWeights(weights);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<long long>(count));
}
BENCHMARK(BM_NormalizeWeights)
  ->Arg(4)
  ->Arg(64)
  ->Arg(1024)
  ->Complexity(benchmark::oN);
