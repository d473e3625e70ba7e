#include "impetus-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

namespace impetus_sim
{

void SemiImplicitEulerIntegrator::step(InertialState& state,
                                       const BodyLoads& loads,
                                       double dt) const
{
  state.acceleration = loads.force * loads.inverseMass;
  state.angularAcceleration = loads.inverseInertia * loads.torque;

  // Kick
  state.velocity += state.acceleration * dt;
  state.angularVelocity += state.angularAcceleration * dt;

  // Drift
  state.position += state.velocity * dt;

  Eigen::Quaterniond const spin{0.0,
                                state.angularVelocity.x(),
                                state.angularVelocity.y(),
                                state.angularVelocity.z()};
  state.orientation.coeffs() +=
    0.5 * dt * (spin * state.orientation).coeffs();
  state.orientation.normalize();
}

}  // namespace impetus_sim
