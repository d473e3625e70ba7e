#include "impetus-sim/src/Physics/RigidBody/InertialCalculations.hpp"

#include <stdexcept>
#include <string>

#include "impetus-sim/src/Physics/RigidBody/BoxCollider.hpp"

namespace impetus_sim::InertialCalculations
{

Eigen::Matrix3d computeBoxInertiaTensor(const BoxCollider& box, double mass)
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("Mass must be positive, got: " +
                                std::to_string(mass));
  }

  const Coordinate& h = box.getHalfExtents();
  double const xx = h.x() * h.x();
  double const yy = h.y() * h.y();
  double const zz = h.z() * h.z();

  Eigen::Matrix3d inertia = Eigen::Matrix3d::Zero();
  inertia(0, 0) = mass / 3.0 * (yy + zz);
  inertia(1, 1) = mass / 3.0 * (xx + zz);
  inertia(2, 2) = mass / 3.0 * (xx + yy);
  return inertia;
}

Eigen::Matrix3d computeSphereInertiaTensor(double radius, double mass)
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("Mass must be positive, got: " +
                                std::to_string(mass));
  }
  if (radius <= 0.0)
  {
    throw std::invalid_argument("Radius must be positive, got: " +
                                std::to_string(radius));
  }

  return Eigen::Matrix3d::Identity() * (0.4 * mass * radius * radius);
}

}  // namespace impetus_sim::InertialCalculations
