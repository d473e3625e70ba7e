#ifndef IMPETUS_SIM_FORCE_RULE_HPP
#define IMPETUS_SIM_FORCE_RULE_HPP

#include <cstdint>
#include <optional>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Input/InputState.hpp"

namespace impetus_sim
{

enum class ForceKind : std::uint8_t
{
  Directional,  ///< Linear force at a point (plus any induced torque)
  Torque        ///< Pure torque, application point ignored
};

/**
 * @brief Configuration of one force a ForceRuleEvaluator may inject
 *
 * A rule fires from a key, from a trigger volume, or from both. Continuous
 * rules apply a force every step their source is active; non-continuous
 * rules apply a single impulse on the activating edge (key press or
 * trigger entry).
 *
 * Usage:
 * @code
 * ForceRule jump;
 * jump.triggerKey = 'j';
 * jump.requiresGrounded = true;
 * jump.strength = 400.0;
 * jump.direction = WorldAxes::up();
 * jump.relativeToOwner = false;
 * @endcode
 */
struct ForceRule
{
  ForceKind kind{ForceKind::Directional};

  double strength{10.0};  // [N], [N*s], [N*m] or [N*m*s] depending on kind/mode

  std::optional<KeyCode> triggerKey;

  // Instance id of the trigger volume that activates this rule
  std::optional<uint32_t> triggerObject;

  bool continuous{false};

  bool requiresGrounded{false};

  // The rule is skipped while the owner's speed is at or above this [m/s]
  double speedCap{10.0};

  // Normalized before use; a zero vector yields no force
  Coordinate direction;

  // Rotate direction by the owner's orientation
  bool relativeToOwner{true};

  // Instance id of an object whose position is the application point.
  // Falls back to the owner's position when absent or not found.
  std::optional<uint32_t> originOverride;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_FORCE_RULE_HPP
