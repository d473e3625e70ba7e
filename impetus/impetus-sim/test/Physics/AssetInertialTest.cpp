#include <gtest/gtest.h>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "impetus-sim/src/Environment/ReferenceFrame.hpp"
#include "impetus-sim/src/Physics/ForceMode.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetInertial.hpp"
#include "impetus-sim/src/Physics/RigidBody/BoxCollider.hpp"
#include "impetus-sim/src/Physics/RigidBody/InertialCalculations.hpp"

using namespace impetus_sim;

namespace
{

AssetInertial createUnitCube(double mass = 10.0,
                             const ReferenceFrame& frame = ReferenceFrame{})
{
  return AssetInertial{1, mass, frame, BoxCollider{Coordinate{0.5, 0.5, 0.5}}};
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST(AssetInertialTest, Constructor_rejectsNonPositiveMass)
{
  EXPECT_THROW(createUnitCube(0.0), std::invalid_argument);
  EXPECT_THROW(createUnitCube(-2.0), std::invalid_argument);
}

TEST(AssetInertialTest, Constructor_copiesFrameIntoState)
{
  Eigen::Quaterniond const yaw{
    Eigen::AngleAxisd{0.3, Eigen::Vector3d::UnitZ()}};
  AssetInertial asset =
    createUnitCube(2.0, ReferenceFrame{Coordinate{1.0, 2.0, 3.0}, yaw});

  const InertialState& state = asset.getInertialState();
  EXPECT_DOUBLE_EQ(state.position.x(), 1.0);
  EXPECT_DOUBLE_EQ(state.position.y(), 2.0);
  EXPECT_DOUBLE_EQ(state.position.z(), 3.0);
  EXPECT_NEAR(state.orientation.angularDistance(yaw), 0.0, 1e-12);
  EXPECT_DOUBLE_EQ(asset.getSpeed(), 0.0);
}

TEST(AssetInertialTest, InertiaTensor_solidBox)
{
  // 2 x 4 x 6 box, mass 3: I_xx = m/12 (b² + c²) = 3/12 (16 + 36) = 13
  AssetInertial asset{
    1, 3.0, ReferenceFrame{}, BoxCollider{Coordinate{1.0, 2.0, 3.0}}};

  const Eigen::Matrix3d& inertia = asset.getInertiaTensor();
  EXPECT_DOUBLE_EQ(inertia(0, 0), 13.0);
  EXPECT_DOUBLE_EQ(inertia(1, 1), 10.0);
  EXPECT_DOUBLE_EQ(inertia(2, 2), 5.0);
  EXPECT_DOUBLE_EQ(inertia(0, 1), 0.0);

  Eigen::Matrix3d const product = inertia * asset.getInverseInertiaTensor();
  EXPECT_TRUE(product.isApprox(Eigen::Matrix3d::Identity(), 1e-12));
}

TEST(AssetInertialTest, InertiaTensor_sphereWithoutCollider)
{
  AssetInertial asset{1, 5.0, ReferenceFrame{}, std::nullopt};

  // 2/5 m r² with r = 0.5
  EXPECT_DOUBLE_EQ(asset.getInertiaTensor()(0, 0), 0.5);
  EXPECT_FALSE(asset.hasCollider());
}

TEST(AssetInertialTest, InertialCalculations_rejectInvalidInput)
{
  BoxCollider const box{Coordinate{1.0, 1.0, 1.0}};
  EXPECT_THROW(InertialCalculations::computeBoxInertiaTensor(box, 0.0),
               std::invalid_argument);
  EXPECT_THROW(InertialCalculations::computeSphereInertiaTensor(0.0, 1.0),
               std::invalid_argument);
}

TEST(AssetInertialTest, WorldInverseInertia_followsOrientation)
{
  Eigen::Quaterniond const quarterTurn{
    Eigen::AngleAxisd{std::numbers::pi / 2.0, Eigen::Vector3d::UnitZ()}};
  AssetInertial asset{1,
                      3.0,
                      ReferenceFrame{Coordinate{}, quarterTurn},
                      BoxCollider{Coordinate{1.0, 2.0, 3.0}}};

  // Body X maps to world Y, so the world yy entry is the body xx entry
  Eigen::Matrix3d const world = asset.getWorldInverseInertiaTensor();
  EXPECT_NEAR(world(1, 1), 1.0 / 13.0, 1e-12);
  EXPECT_NEAR(world(0, 0), 1.0 / 10.0, 1e-12);
}

// ============================================================================
// Force Accumulation
// ============================================================================

TEST(AssetInertialTest, applyForce_accumulatesForce)
{
  AssetInertial asset = createUnitCube();

  asset.applyForce(ForceVector{10.0, 0.0, 0.0});
  asset.applyForce(ForceVector{0.0, 5.0, 0.0});

  const ForceVector& accumulated = asset.getAccumulatedForce();
  EXPECT_DOUBLE_EQ(accumulated.x(), 10.0);
  EXPECT_DOUBLE_EQ(accumulated.y(), 5.0);
  EXPECT_DOUBLE_EQ(accumulated.z(), 0.0);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedTorque().norm(), 0.0);
}

TEST(AssetInertialTest, applyForceAtPoint_producesLeverTorque)
{
  AssetInertial asset =
    createUnitCube(10.0, ReferenceFrame{Coordinate{1.0, 1.0, 1.0}});

  // r = (1, 0, 0), F = (0, 10, 0): τ = r × F = (0, 0, 10)
  asset.applyForceAtPoint(ForceVector{0.0, 10.0, 0.0}, Coordinate{2.0, 1.0, 1.0});

  EXPECT_DOUBLE_EQ(asset.getAccumulatedForce().y(), 10.0);
  const TorqueVector& torque = asset.getAccumulatedTorque();
  EXPECT_DOUBLE_EQ(torque.x(), 0.0);
  EXPECT_DOUBLE_EQ(torque.y(), 0.0);
  EXPECT_DOUBLE_EQ(torque.z(), 10.0);
}

TEST(AssetInertialTest, applyForceAtCentre_producesNoTorque)
{
  AssetInertial asset =
    createUnitCube(10.0, ReferenceFrame{Coordinate{3.0, -2.0, 1.0}});

  asset.applyForceAtPoint(ForceVector{4.0, 5.0, 6.0}, Coordinate{3.0, -2.0, 1.0});

  EXPECT_DOUBLE_EQ(asset.getAccumulatedTorque().norm(), 0.0);
}

TEST(AssetInertialTest, clearForces_resetsAccumulators)
{
  AssetInertial asset = createUnitCube();

  asset.applyForce(ForceVector{10.0, 5.0, 3.0});
  asset.applyTorque(TorqueVector{1.0, 2.0, 3.0});
  asset.clearForces();

  EXPECT_DOUBLE_EQ(asset.getAccumulatedForce().norm(), 0.0);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedTorque().norm(), 0.0);
}

// ============================================================================
// Impulses
// ============================================================================

TEST(AssetInertialTest, applyImpulse_changesVelocityByImpulseOverMass)
{
  AssetInertial asset = createUnitCube(4.0);

  asset.applyImpulse(ForceVector{8.0, 0.0, -2.0});

  const Coordinate& velocity = asset.getInertialState().velocity;
  EXPECT_DOUBLE_EQ(velocity.x(), 2.0);
  EXPECT_DOUBLE_EQ(velocity.z(), -0.5);
  // Accumulators are untouched
  EXPECT_DOUBLE_EQ(asset.getAccumulatedForce().norm(), 0.0);
}

TEST(AssetInertialTest, applyImpulseAtPoint_spinsBody)
{
  AssetInertial asset = createUnitCube(6.0);

  // Unit cube of mass 6: I = m/6 = 1 on every axis
  asset.applyImpulseAtPoint(ForceVector{0.0, 3.0, 0.0}, Coordinate{1.0, 0.0, 0.0});

  const InertialState& state = asset.getInertialState();
  EXPECT_DOUBLE_EQ(state.velocity.y(), 0.5);
  EXPECT_NEAR(state.angularVelocity.z(), 3.0, 1e-12);
}

TEST(AssetInertialTest, addForceAtPosition_dispatchesOnMode)
{
  AssetInertial asset = createUnitCube(2.0);

  asset.addForceAtPosition(
    ForceVector{0.0, 0.0, 4.0}, Coordinate{0.0, 0.0, 0.0}, ForceMode::Force);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedForce().z(), 4.0);
  EXPECT_DOUBLE_EQ(asset.getInertialState().velocity.z(), 0.0);

  asset.addForceAtPosition(
    ForceVector{0.0, 0.0, 4.0}, Coordinate{0.0, 0.0, 0.0}, ForceMode::Impulse);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedForce().z(), 4.0);
  EXPECT_DOUBLE_EQ(asset.getInertialState().velocity.z(), 2.0);
}

TEST(AssetInertialTest, addTorque_dispatchesOnMode)
{
  AssetInertial asset = createUnitCube(6.0);

  asset.addTorque(TorqueVector{0.0, 0.0, 2.0}, ForceMode::Force);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedTorque().z(), 2.0);

  asset.addTorque(TorqueVector{0.0, 0.0, 2.0}, ForceMode::Impulse);
  EXPECT_DOUBLE_EQ(asset.getAccumulatedTorque().z(), 2.0);
  EXPECT_NEAR(asset.getInertialState().angularVelocity.z(), 2.0, 1e-12);
}
