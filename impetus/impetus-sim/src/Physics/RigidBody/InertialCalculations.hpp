#ifndef IMPETUS_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP
#define IMPETUS_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP

#include <Eigen/Dense>

namespace impetus_sim
{

class BoxCollider;

/**
 * @brief Utility functions for computing inertial properties of primitives.
 *
 * All tensors are about the centroid, in the body frame, assuming uniform
 * density.
 */
namespace InertialCalculations
{

/**
 * @brief Inertia tensor of a solid box.
 *
 * I_xx = m/3 * (hy² + hz²), etc. with h the half extents.
 *
 * @param box Box shape
 * @param mass Mass in kilograms [kg]
 * @return 3x3 diagonal inertia tensor [kg⋅m²]
 * @throws std::invalid_argument if mass <= 0
 */
Eigen::Matrix3d computeBoxInertiaTensor(const BoxCollider& box, double mass);

/**
 * @brief Inertia tensor of a solid sphere, I = 2/5 m r².
 *
 * @throws std::invalid_argument if mass <= 0 or radius <= 0
 */
Eigen::Matrix3d computeSphereInertiaTensor(double radius, double mass);

}  // namespace InertialCalculations

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_INERTIAL_CALCULATIONS_HPP
