#include "impetus-sim/src/Physics/RigidBody/AssetInertial.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "impetus-sim/src/Physics/RigidBody/InertialCalculations.hpp"

namespace impetus_sim
{

namespace
{

// Stand-in shape for bodies that carry no collider
constexpr double kDefaultInertiaRadius = 0.5;

}  // namespace

AssetInertial::AssetInertial(uint32_t instanceId,
                             double mass,
                             const ReferenceFrame& frame,
                             std::optional<BoxCollider> collider)
  : AssetPhysical{instanceId, frame, std::move(collider)},
    mass_{mass},
    inertiaTensor_{Eigen::Matrix3d::Zero()},
    inverseInertiaTensor_{Eigen::Matrix3d::Zero()},
    state_{},
    accumulatedForce_{0.0, 0.0, 0.0},
    accumulatedTorque_{0.0, 0.0, 0.0}
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("Mass must be positive, got: " +
                                std::to_string(mass));
  }

  inertiaTensor_ =
    collider_ ? InertialCalculations::computeBoxInertiaTensor(*collider_, mass)
              : InertialCalculations::computeSphereInertiaTensor(
                  kDefaultInertiaRadius, mass);
  inverseInertiaTensor_ = inertiaTensor_.inverse();

  state_.position = frame.getOrigin();
  state_.orientation = frame.getOrientation();
}

double AssetInertial::getMass() const
{
  return mass_;
}

const Eigen::Matrix3d& AssetInertial::getInertiaTensor() const
{
  return inertiaTensor_;
}

const Eigen::Matrix3d& AssetInertial::getInverseInertiaTensor() const
{
  return inverseInertiaTensor_;
}

Eigen::Matrix3d AssetInertial::getWorldInverseInertiaTensor() const
{
  Eigen::Matrix3d const R = referenceFrame_.getRotation();
  return R * inverseInertiaTensor_ * R.transpose();
}

const InertialState& AssetInertial::getInertialState() const
{
  return state_;
}

InertialState& AssetInertial::getInertialState()
{
  return state_;
}

void AssetInertial::syncReferenceFrame()
{
  referenceFrame_.setOrigin(state_.position);
  referenceFrame_.setOrientation(state_.orientation);
}

void AssetInertial::setLinearVelocity(const Coordinate& velocity)
{
  state_.velocity = velocity;
}

double AssetInertial::getSpeed() const
{
  return state_.speed();
}

void AssetInertial::applyForce(const ForceVector& force)
{
  accumulatedForce_ += force;
}

void AssetInertial::applyForceAtPoint(const ForceVector& force,
                                      const Coordinate& worldPoint)
{
  applyForce(force);

  // τ = r × F
  Coordinate const r = worldPoint - state_.position;
  applyTorque(TorqueVector{r.cross(force)});
}

void AssetInertial::applyTorque(const TorqueVector& torque)
{
  accumulatedTorque_ += torque;
}

void AssetInertial::applyImpulse(const ForceVector& impulse)
{
  state_.velocity += impulse / mass_;
}

void AssetInertial::applyImpulseAtPoint(const ForceVector& impulse,
                                        const Coordinate& worldPoint)
{
  applyImpulse(impulse);

  Coordinate const r = worldPoint - state_.position;
  applyAngularImpulse(TorqueVector{r.cross(impulse)});
}

void AssetInertial::applyAngularImpulse(const TorqueVector& impulse)
{
  state_.angularVelocity += getWorldInverseInertiaTensor() * impulse;
}

void AssetInertial::addForceAtPosition(const ForceVector& force,
                                       const Coordinate& worldPoint,
                                       ForceMode mode)
{
  switch (mode)
  {
    case ForceMode::Force:
      applyForceAtPoint(force, worldPoint);
      break;
    case ForceMode::Impulse:
      applyImpulseAtPoint(force, worldPoint);
      break;
  }
}

void AssetInertial::addTorque(const TorqueVector& torque, ForceMode mode)
{
  switch (mode)
  {
    case ForceMode::Force:
      applyTorque(torque);
      break;
    case ForceMode::Impulse:
      applyAngularImpulse(torque);
      break;
  }
}

const ForceVector& AssetInertial::getAccumulatedForce() const
{
  return accumulatedForce_;
}

const TorqueVector& AssetInertial::getAccumulatedTorque() const
{
  return accumulatedTorque_;
}

void AssetInertial::clearForces()
{
  accumulatedForce_ = ForceVector{0.0, 0.0, 0.0};
  accumulatedTorque_ = TorqueVector{0.0, 0.0, 0.0};
}

}  // namespace impetus_sim
