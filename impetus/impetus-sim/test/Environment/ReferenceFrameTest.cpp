#include <gtest/gtest.h>
#include <cmath>
#include <numbers>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Environment/ReferenceFrame.hpp"

using namespace impetus_sim;

namespace
{

constexpr double kTolerance = 1e-12;

bool coordinatesEqual(const Coordinate& c1,
                      const Coordinate& c2,
                      double tolerance = kTolerance)
{
  return (c1 - c2).cwiseAbs().maxCoeff() <= tolerance;
}

Eigen::Quaterniond yaw(double angle)
{
  return Eigen::Quaterniond{Eigen::AngleAxisd{angle, Eigen::Vector3d::UnitZ()}};
}

}  // anonymous namespace

// ============================================================================
// Constructor Tests
// ============================================================================

TEST(ReferenceFrameTest, DefaultConstructor)
{
  ReferenceFrame frame;

  EXPECT_TRUE(coordinatesEqual(frame.getOrigin(), Coordinate{0.0, 0.0, 0.0}));
  EXPECT_TRUE(frame.getRotation().isIdentity());
  EXPECT_TRUE(coordinatesEqual(frame.forward(), Coordinate{1.0, 0.0, 0.0}));
  EXPECT_TRUE(coordinatesEqual(frame.up(), Coordinate{0.0, 0.0, 1.0}));
}

TEST(ReferenceFrameTest, Constructor_normalizesOrientation)
{
  Eigen::Quaterniond const scaled{2.0, 0.0, 0.0, 0.0};
  ReferenceFrame frame{Coordinate{1.0, 2.0, 3.0}, scaled};

  EXPECT_NEAR(frame.getOrientation().norm(), 1.0, kTolerance);
  EXPECT_TRUE(frame.getRotation().isIdentity(kTolerance));
}

// ============================================================================
// Transformations
// ============================================================================

TEST(ReferenceFrameTest, GlobalToLocal_translationOnly)
{
  ReferenceFrame frame{Coordinate{10.0, 5.0, 0.0}};

  Coordinate local = frame.globalToLocal(Coordinate{11.0, 5.0, 2.0});
  EXPECT_TRUE(coordinatesEqual(local, Coordinate{1.0, 0.0, 2.0}));
}

TEST(ReferenceFrameTest, LocalToGlobal_rotationAndTranslation)
{
  ReferenceFrame frame{Coordinate{1.0, 1.0, 0.0}, yaw(std::numbers::pi / 2.0)};

  // Local +X points along global +Y
  Coordinate global = frame.localToGlobal(Coordinate{2.0, 0.0, 0.0});
  EXPECT_TRUE(coordinatesEqual(global, Coordinate{1.0, 3.0, 0.0}));
  EXPECT_TRUE(coordinatesEqual(frame.forward(), Coordinate{0.0, 1.0, 0.0}));
}

TEST(ReferenceFrameTest, RelativeTransforms_ignoreOrigin)
{
  ReferenceFrame frame{Coordinate{100.0, -50.0, 7.0}, yaw(std::numbers::pi)};

  Coordinate const global =
    frame.localToGlobalRelative(Coordinate{1.0, 0.0, 0.0});
  EXPECT_TRUE(coordinatesEqual(global, Coordinate{-1.0, 0.0, 0.0}));

  Coordinate const local = frame.globalToLocalRelative(global);
  EXPECT_TRUE(coordinatesEqual(local, Coordinate{1.0, 0.0, 0.0}));
}

TEST(ReferenceFrameTest, RoundTrip_arbitraryFrame)
{
  Eigen::Quaterniond const orientation{
    Eigen::AngleAxisd{0.7, Eigen::Vector3d{1.0, 2.0, 3.0}.normalized()}};
  ReferenceFrame frame{Coordinate{-2.0, 4.0, 1.5}, orientation};

  Coordinate const point{3.0, -1.0, 0.25};
  EXPECT_TRUE(
    coordinatesEqual(frame.globalToLocal(frame.localToGlobal(point)), point));
}

TEST(ReferenceFrameTest, SetOrientation_rotatesAxes)
{
  ReferenceFrame frame;
  EXPECT_TRUE(coordinatesEqual(frame.forward(), Coordinate{1.0, 0.0, 0.0}));

  frame.setOrientation(yaw(std::numbers::pi / 2.0));
  EXPECT_TRUE(coordinatesEqual(frame.forward(), Coordinate{0.0, 1.0, 0.0}));

  frame.setOrigin(Coordinate{0.0, 0.0, 9.0});
  EXPECT_DOUBLE_EQ(frame.getOrigin().z(), 9.0);
}
