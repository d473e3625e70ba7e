#ifndef IMPETUS_SIM_WORLD_AXES_HPP
#define IMPETUS_SIM_WORLD_AXES_HPP

#include "impetus-sim/src/DataTypes/Coordinate.hpp"

namespace impetus_sim::WorldAxes
{

// Right-handed, Z up, X forward (aerospace convention).

inline Coordinate forward()
{
  return Coordinate{1.0, 0.0, 0.0};
}

inline Coordinate left()
{
  return Coordinate{0.0, 1.0, 0.0};
}

inline Coordinate up()
{
  return Coordinate{0.0, 0.0, 1.0};
}

inline Coordinate down()
{
  return Coordinate{0.0, 0.0, -1.0};
}

}  // namespace impetus_sim::WorldAxes

#endif  // IMPETUS_SIM_WORLD_AXES_HPP
