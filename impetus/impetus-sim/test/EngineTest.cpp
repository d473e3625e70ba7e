#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>

#include "impetus-sim/src/DataTypes/WorldAxes.hpp"
#include "impetus-sim/src/Engine.hpp"
#include "impetus-sim/src/Noise/NoiseSource.hpp"

using namespace impetus_sim;
using namespace std::chrono_literals;

namespace
{

constexpr KeyCode kKeyJump = 0x20;
constexpr KeyCode kKeyThrust = 'w';

class FullNoise : public NoiseSource
{
public:
  double sample(double /* x */) const override
  {
    return 1.0;
  }
};

AssetInertial& spawnGroundedCrate(Engine& engine)
{
  WorldModel& world = engine.getWorldModel();
  world.spawnEnvironmentObject(ReferenceFrame{Coordinate{0.0, 0.0, -0.5}},
                               BoxCollider{Coordinate{50.0, 50.0, 0.5}});
  return world.spawnInertialObject(ReferenceFrame{Coordinate{0.0, 0.0, 0.5}},
                                   2.0,
                                   BoxCollider{Coordinate{0.5, 0.5, 0.5}});
}

ForceRule jumpRule()
{
  ForceRule jump;
  jump.triggerKey = kKeyJump;
  jump.requiresGrounded = true;
  jump.strength = 8.0;
  jump.direction = WorldAxes::up();
  jump.relativeToOwner = false;
  return jump;
}

}  // anonymous namespace

TEST(EngineTest, Update_rejectsTimeGoingBackwards)
{
  Engine engine;

  engine.update(32ms);
  EXPECT_THROW(engine.update(16ms), std::invalid_argument);
  EXPECT_EQ(engine.getLastUpdateTime(), 32ms);
}

TEST(EngineTest, Update_sameTimeIsNoOp)
{
  Engine engine;
  AssetInertial& crate = spawnGroundedCrate(engine);
  crate.setLinearVelocity(Coordinate{1.0, 0.0, 0.0});

  engine.update(0ms);
  EXPECT_DOUBLE_EQ(engine.getWorldModel().getTime(), 0.0);

  engine.update(100ms);
  engine.update(100ms);
  EXPECT_NEAR(engine.getWorldModel().getTime(), 0.1, 1e-12);
}

TEST(EngineTest, Update_stepsWorldByElapsedTime)
{
  Engine engine;
  engine.getWorldModel().setGravity(Coordinate{0.0, 0.0, 0.0});
  AssetInertial& body = engine.getWorldModel().spawnInertialObject(
    ReferenceFrame{}, 1.0, std::nullopt);
  body.setLinearVelocity(Coordinate{2.0, 0.0, 0.0});

  engine.update(250ms);
  engine.update(500ms);

  EXPECT_NEAR(body.getInertialState().position.x(), 1.0, 1e-12);
  EXPECT_NEAR(engine.getWorldModel().getTime(), 0.5, 1e-12);
}

TEST(EngineTest, JumpKey_firesOncePerPressAcrossFrames)
{
  Engine engine;
  AssetInertial& crate = spawnGroundedCrate(engine);
  ForceRuleEvaluator& evaluator =
    engine.addForceRuleEvaluator(crate.getInstanceId(), {jumpRule()});

  engine.setKeyState(kKeyJump, true);
  engine.update(10ms);
  EXPECT_TRUE(evaluator.isActive(0));

  // v0 = 8 / 2 = 4 m/s, less one step of gravity
  EXPECT_NEAR(crate.getInertialState().velocity.z(), 4.0 - 9.81 * 0.01, 1e-9);
  EXPECT_FALSE(engine.getInputState().isKeyJustPressed(kKeyJump));

  // Holding the key does not jump again
  engine.update(20ms);
  EXPECT_FALSE(evaluator.isActive(0));
  EXPECT_NEAR(crate.getInertialState().velocity.z(), 4.0 - 9.81 * 0.02, 1e-9);
}

TEST(EngineTest, JumpKey_tapBetweenFramesStillJumps)
{
  Engine engine;
  AssetInertial& crate = spawnGroundedCrate(engine);
  ForceRuleEvaluator& evaluator =
    engine.addForceRuleEvaluator(crate.getInstanceId(), {jumpRule()});

  engine.setKeyState(kKeyJump, true);
  engine.setKeyState(kKeyJump, false);
  engine.update(10ms);

  EXPECT_TRUE(evaluator.isActive(0));
  EXPECT_NEAR(crate.getInertialState().velocity.z(), 4.0 - 9.81 * 0.01, 1e-9);

  engine.update(20ms);
  EXPECT_FALSE(evaluator.isActive(0));
}

TEST(EngineTest, Thruster_speedCapLimitsAcceleration)
{
  Engine engine;
  engine.getWorldModel().setGravity(Coordinate{0.0, 0.0, 0.0});
  AssetInertial& body = engine.getWorldModel().spawnInertialObject(
    ReferenceFrame{}, 1.0, BoxCollider{Coordinate{0.5, 0.5, 0.5}});

  ForceRule thrust;
  thrust.triggerKey = kKeyThrust;
  thrust.continuous = true;
  thrust.strength = 10.0;
  thrust.speedCap = 1.0;
  thrust.direction = WorldAxes::forward();
  engine.addForceRuleEvaluator(body.getInstanceId(), {thrust});

  engine.setKeyState(kKeyThrust, true);
  for (int frame = 1; frame <= 100; ++frame)
  {
    engine.update(10ms * frame);
  }

  // Once at the cap the rule stops firing; the last firing adds 0.1 m/s
  double const speed = body.getSpeed();
  EXPECT_GE(speed, 1.0);
  EXPECT_LT(speed, 1.0 + 0.1 + 1e-9);
}

TEST(EngineTest, WindZone_resampledEachFrame)
{
  Engine engine;
  engine.getWorldModel().setGravity(Coordinate{0.0, 0.0, 0.0});
  uint32_t const tunnel =
    engine.getWorldModel()
      .spawnTriggerVolume(ReferenceFrame{}, BoxCollider{Coordinate{5.0, 5.0, 5.0}})
      .getInstanceId();
  AssetInertial& body = engine.getWorldModel().spawnInertialObject(
    ReferenceFrame{}, 1.0, BoxCollider{Coordinate{0.5, 0.5, 0.5}});

  WindZoneConfig config;
  config.baseForce = 20.0;
  config.minForce = 5.0;
  config.useVariation = true;
  WindZone& zone =
    engine.addWindZone(tunnel, config, std::make_shared<FullNoise>());

  EXPECT_DOUBLE_EQ(zone.getCurrentForce(), 5.0);
  engine.update(100ms);

  EXPECT_DOUBLE_EQ(zone.getCurrentForce(), 20.0);
  EXPECT_NEAR(body.getInertialState().velocity.x(), 2.0, 1e-12);
  EXPECT_EQ(engine.getWindZones().size(), 1u);
}

TEST(EngineTest, AddWindZone_rejectsInvalidTrigger)
{
  Engine engine;
  EXPECT_THROW(engine.addWindZone(7, WindZoneConfig{}), std::invalid_argument);
  EXPECT_TRUE(engine.getWindZones().empty());
}
