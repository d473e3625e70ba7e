#ifndef IMPETUS_SIM_FORCE_RULE_EVALUATOR_HPP
#define IMPETUS_SIM_FORCE_RULE_EVALUATOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Environment/TriggerEvent.hpp"
#include "impetus-sim/src/Forces/ForceRule.hpp"
#include "impetus-sim/src/Forces/ForceVisualization.hpp"
#include "impetus-sim/src/Input/InputState.hpp"
#include "impetus-sim/src/Physics/ForceMode.hpp"

namespace impetus_sim
{

class AssetInertial;
class WorldModel;

/**
 * @brief Applies configured force rules to one dynamic body
 *
 * Each rule is gated by:
 * - its source: key held / key just pressed (update()), or trigger
 *   stay / enter for the rule's trigger volume (trigger handlers)
 * - an optional ground check: a ray from the owner's position straight
 *   down, of length (owner half height + kGroundProbeMargin)
 * - a speed cap: the owner's speed must be strictly below speedCap
 *
 * Continuous rules apply ForceMode::Force while their source is active.
 * Non-continuous rules apply ForceMode::Impulse on the activating edge.
 *
 * Missing references are not errors: an owner that is not a dynamic body
 * receives nothing, a body without collider is never grounded, and an
 * origin override that does not resolve falls back to the owner position.
 *
 * The evaluator registers itself with the world for trigger events on
 * construction and unregisters on destruction; it must not outlive the
 * world.
 *
 * Usage:
 * @code
 * ForceRuleEvaluator evaluator{world, player.getInstanceId(), {jump, thrust}};
 *
 * // Once per frame, before world.step()
 * evaluator.update(input);
 * world.step(dt);
 * input.update(frameTime);
 * @endcode
 */
class ForceRuleEvaluator : public TriggerListener
{
public:
  // Added to the owner's half height for the ground probe [m]
  static constexpr double kGroundProbeMargin = 0.1;

  ForceRuleEvaluator(WorldModel& world,
                     uint32_t ownerId,
                     std::vector<ForceRule> rules);

  ~ForceRuleEvaluator() override;

  ForceRuleEvaluator(const ForceRuleEvaluator&) = delete;
  ForceRuleEvaluator& operator=(const ForceRuleEvaluator&) = delete;
  ForceRuleEvaluator(ForceRuleEvaluator&&) = delete;
  ForceRuleEvaluator& operator=(ForceRuleEvaluator&&) = delete;

  /**
   * @brief Per-frame pass over key-bound rules
   *
   * Refreshes the cached ground state, clears every rule's activity flag,
   * then fires key-bound rules whose gates pass.
   */
  void update(const InputState& input);

  /**
   * @brief Fires non-continuous rules bound to the entered trigger
   */
  void onTriggerEnter(const TriggerEvent& event) override;

  /**
   * @brief Fires continuous rules bound to the overlapped trigger
   */
  void onTriggerStay(const TriggerEvent& event) override;

  /**
   * @brief Run the ground probe now
   * @return false if the owner is missing or has no collider
   */
  [[nodiscard]] bool checkGrounded() const;

  /**
   * @brief Ground state cached by the last update()
   */
  [[nodiscard]] bool isGrounded() const
  {
    return grounded_;
  }

  [[nodiscard]] uint32_t getOwnerId() const
  {
    return ownerId_;
  }

  [[nodiscard]] const std::vector<ForceRule>& getRules() const
  {
    return rules_;
  }

  /**
   * @brief Whether a rule fired since the last update()
   * @throws std::out_of_range if index is not a rule
   */
  [[nodiscard]] bool isActive(std::size_t index) const;

  /**
   * @brief World-space unit direction the rule would push along now
   * @throws std::out_of_range if index is not a rule
   */
  [[nodiscard]] Coordinate resolveDirection(std::size_t index) const;

  /**
   * @brief World-space application point the rule would use now
   * @throws std::out_of_range if index is not a rule
   */
  [[nodiscard]] Coordinate resolveOrigin(std::size_t index) const;

  /**
   * @throws std::out_of_range if index is not a rule
   */
  [[nodiscard]] ForceVisualization visualize(std::size_t index) const;

  [[nodiscard]] std::vector<ForceVisualization> visualizeAll() const;

private:
  [[nodiscard]] bool passesGates(const ForceRule& rule,
                                 const AssetInertial& owner) const;

  void apply(std::size_t index, AssetInertial& owner, ForceMode mode);

  void fireTriggerRules(const TriggerEvent& event, bool continuous);

  WorldModel& world_;
  uint32_t ownerId_;
  std::vector<ForceRule> rules_;

  // Indexed like rules_; kept apart so the rule records stay immutable
  std::vector<bool> active_;

  bool grounded_{false};
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_FORCE_RULE_EVALUATOR_HPP
