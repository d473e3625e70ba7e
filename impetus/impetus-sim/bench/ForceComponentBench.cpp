// Benchmarks for per-frame force evaluation: rule gating with ground probes,
// and wind zones pushing many overlapping bodies.

#include <benchmark/benchmark.h>

#include <memory>
#include <vector>

#include "impetus-sim/src/DataTypes/WorldAxes.hpp"
#include "impetus-sim/src/Environment/WorldModel.hpp"
#include "impetus-sim/src/Forces/ForceRuleEvaluator.hpp"
#include "impetus-sim/src/Forces/WindZone.hpp"
#include "impetus-sim/src/Input/InputState.hpp"
#include "impetus-sim/src/Noise/PerlinNoise1D.hpp"

using namespace impetus_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kDt = 1.0 / 60.0;       // 60 FPS timestep
constexpr double kBodySpacing = 2.0;     // Spacing between bodies on floor
constexpr double kFloorHalfSize = 100.0; // Floor half-extent
constexpr double kCubeHalfSize = 0.5;    // Crate half-extent
constexpr double kMass = 10.0;           // Default mass [kg]
constexpr KeyCode kKeyThrust = 'w';

// Crates resting in a row on a floor whose top face is z = 0
struct BenchSetup
{
  WorldModel world;
  std::vector<uint32_t> bodyIds;

  explicit BenchSetup(int numBodies)
  {
    world.spawnEnvironmentObject(
      ReferenceFrame{Coordinate{0.0, 0.0, -kFloorHalfSize}},
      BoxCollider{Coordinate{kFloorHalfSize, kFloorHalfSize, kFloorHalfSize}});

    for (int i = 0; i < numBodies; ++i)
    {
      ReferenceFrame const frame{Coordinate{
        static_cast<double>(i) * kBodySpacing, 0.0, kCubeHalfSize}};
      bodyIds.push_back(
        world
          .spawnInertialObject(frame,
                               kMass,
                               BoxCollider{Coordinate{
                                 kCubeHalfSize, kCubeHalfSize, kCubeHalfSize}})
          .getInstanceId());
    }
  }
};

std::vector<ForceRule> createGroundedRules(int numRules)
{
  std::vector<ForceRule> rules;
  for (int i = 0; i < numRules; ++i)
  {
    ForceRule rule;
    rule.triggerKey = kKeyThrust;
    rule.continuous = true;
    rule.requiresGrounded = true;
    rule.speedCap = 1e9;
    rule.direction = WorldAxes::forward();
    rules.push_back(rule);
  }
  return rules;
}

}  // namespace

// ============================================================================
// ForceRuleEvaluator::update
// ============================================================================

// Ground probe cost grows with the number of colliders in the world
static void BM_ForceRuleEvaluator_Update(benchmark::State& state)
{
  int numBodies = static_cast<int>(state.range(0));
  BenchSetup setup{numBodies};
  ForceRuleEvaluator evaluator{
    setup.world, setup.bodyIds.front(), createGroundedRules(4)};

  InputState input;
  input.updateKey(kKeyThrust, true);

  for (auto _ : state)
  {
    evaluator.update(input);
    benchmark::DoNotOptimize(evaluator.isActive(0));
  }
}
BENCHMARK(BM_ForceRuleEvaluator_Update)
  ->Arg(1)
  ->Arg(16)
  ->Arg(128);

// ============================================================================
// WindZone over a full world step
// ============================================================================

static void BM_WindZone_Step(benchmark::State& state)
{
  int numBodies = static_cast<int>(state.range(0));
  BenchSetup setup{numBodies};
  setup.world.setGravity(Coordinate{0.0, 0.0, 0.0});

  double const tunnelHalfLength =
    static_cast<double>(numBodies) * kBodySpacing;
  uint32_t const tunnel =
    setup.world
      .spawnTriggerVolume(ReferenceFrame{Coordinate{0.0, 0.0, kCubeHalfSize}},
                          BoxCollider{Coordinate{tunnelHalfLength, 2.0, 2.0}})
      .getInstanceId();

  WindZoneConfig config;
  config.useVariation = true;
  WindZone zone{setup.world, tunnel, config, std::make_shared<PerlinNoise1D>()};

  double elapsed = 0.0;
  for (auto _ : state)
  {
    zone.update(elapsed);
    setup.world.step(kDt);
    elapsed += kDt;
  }
}
BENCHMARK(BM_WindZone_Step)
  ->Arg(1)
  ->Arg(16)
  ->Arg(128);

// ============================================================================
// PerlinNoise1D::sample
// ============================================================================

static void BM_PerlinNoise1D_Sample(benchmark::State& state)
{
  PerlinNoise1D const noise{0, static_cast<int>(state.range(0))};
  double x = 0.0;

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(noise.sample(x));
    x += 0.013;
  }
}
BENCHMARK(BM_PerlinNoise1D_Sample)
  ->Arg(1)
  ->Arg(4);

BENCHMARK_MAIN();
