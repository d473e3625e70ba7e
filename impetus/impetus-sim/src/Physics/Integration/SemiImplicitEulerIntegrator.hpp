#ifndef IMPETUS_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define IMPETUS_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "impetus-sim/src/Physics/Integration/Integrator.hpp"

namespace impetus_sim
{

/**
 * @brief First-order symplectic Euler step
 *
 * Velocities are kicked first and the updated velocities then drift the
 * pose:
 *
 *   v' = v + F/m dt         ω' = ω + I⁻¹τ dt
 *   x' = x + v' dt          q' = normalize(q + ½ [0, ω'] ⊗ q dt)
 *
 * The body resting on a floor sees its gravity kick undone by push-out
 * every step, so it stays put instead of drifting through.
 */
class SemiImplicitEulerIntegrator final : public Integrator
{
public:
  void step(InertialState& state,
            const BodyLoads& loads,
            double dt) const override;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
