#include <gtest/gtest.h>
#include <cmath>
#include <type_traits>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/DataTypes/ForceVector.hpp"
#include "impetus-sim/src/DataTypes/TorqueVector.hpp"

using namespace impetus_sim;

TEST(Vec3DBaseTest, DefaultConstructor_isZero)
{
  Coordinate const c;
  ForceVector const f;

  EXPECT_DOUBLE_EQ(c.norm(), 0.0);
  EXPECT_DOUBLE_EQ(f.norm(), 0.0);
}

TEST(Vec3DBaseTest, NormalizedOrZero_unitLengthForNonZero)
{
  Coordinate const c{0.0, 3.0, -4.0};
  Coordinate const unit = c.normalizedOrZero();

  EXPECT_DOUBLE_EQ(unit.norm(), 1.0);
  EXPECT_DOUBLE_EQ(unit.y(), 0.6);
  EXPECT_DOUBLE_EQ(unit.z(), -0.8);
}

TEST(Vec3DBaseTest, NormalizedOrZero_zeroStaysZero)
{
  Coordinate const unit = Coordinate{0.0, 0.0, 0.0}.normalizedOrZero();

  EXPECT_FALSE(std::isnan(unit.x()));
  EXPECT_DOUBLE_EQ(unit.norm(), 0.0);
}

TEST(Vec3DBaseTest, NormalizedOrZero_keepsQuantityType)
{
  ForceVector const f{2.0, 0.0, 0.0};

  static_assert(
    std::is_same_v<decltype(f.normalizedOrZero()), ForceVector>);
  static_assert(
    std::is_same_v<decltype(TorqueVector{}.normalizedOrZero()), TorqueVector>);
  EXPECT_DOUBLE_EQ(f.normalizedOrZero().x(), 1.0);
}

TEST(Vec3DBaseTest, EigenExpressions_convertToQuantity)
{
  Coordinate const direction{0.0, 0.0, 1.0};
  ForceVector const force = direction * 12.5;
  TorqueVector const torque = Coordinate{1.0, 0.0, 0.0}.cross(force);

  EXPECT_DOUBLE_EQ(force.z(), 12.5);
  EXPECT_DOUBLE_EQ(torque.y(), -12.5);
}
