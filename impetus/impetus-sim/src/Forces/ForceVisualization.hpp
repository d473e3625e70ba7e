#ifndef IMPETUS_SIM_FORCE_VISUALIZATION_HPP
#define IMPETUS_SIM_FORCE_VISUALIZATION_HPP

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Forces/ForceRule.hpp"

namespace impetus_sim
{

/**
 * @brief Read-only snapshot of a force for debug renderers
 *
 * Carries no physical meaning; a renderer may draw an arrow from origin
 * along direction scaled by magnitude, or an arc around direction for
 * torques, coloured by active.
 */
struct ForceVisualization
{
  ForceKind kind{ForceKind::Directional};
  Coordinate origin;
  Coordinate direction;  // Unit length, or zero
  double magnitude{0.0};
  bool active{false};
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_FORCE_VISUALIZATION_HPP
