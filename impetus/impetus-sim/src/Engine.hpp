#ifndef IMPETUS_SIM_ENGINE_HPP
#define IMPETUS_SIM_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "impetus-sim/src/Environment/WorldModel.hpp"
#include "impetus-sim/src/Forces/ForceRuleEvaluator.hpp"
#include "impetus-sim/src/Forces/WindZone.hpp"
#include "impetus-sim/src/Input/InputState.hpp"

namespace impetus_sim
{

/**
 * @brief Top-level simulation orchestrator
 *
 * Owns the world, the keyboard state and the force components acting on the
 * world. Each update runs one frame:
 * 1. every ForceRuleEvaluator reads the input
 * 2. every WindZone resamples its variation
 * 3. the world steps (trigger dispatch, integration)
 * 4. the input clock advances, clearing just-pressed edges
 *
 * Components are destroyed before the world they reference.
 *
 * @note Not thread-safe, single-threaded simulation assumed.
 */
class Engine
{
public:
  Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;

  /**
   * @brief Advance the simulation to the given absolute time
   * @param simTime Absolute simulation time (not a delta). Pass increasing
   *        values on each call (e.g. 16ms, 32ms, 48ms for 60 FPS).
   * @throws std::invalid_argument if simTime is earlier than the last update
   *
   * A call with the same time as the previous one does nothing.
   */
  void update(std::chrono::milliseconds simTime);

  /**
   * @brief Forward a key event from the front end
   */
  void setKeyState(KeyCode key, bool pressed);

  /**
   * @brief Create an evaluator for a dynamic body
   * @return Reference valid for the engine's lifetime
   */
  ForceRuleEvaluator& addForceRuleEvaluator(uint32_t ownerId,
                                            std::vector<ForceRule> rules);

  /**
   * @brief Create a wind zone over an existing trigger volume
   * @throws std::invalid_argument if triggerId is not a trigger volume
   */
  WindZone& addWindZone(uint32_t triggerId,
                        const WindZoneConfig& config,
                        std::shared_ptr<const NoiseSource> noise = nullptr);

  WorldModel& getWorldModel()
  {
    return worldModel_;
  }

  const WorldModel& getWorldModel() const
  {
    return worldModel_;
  }

  const InputState& getInputState() const
  {
    return inputState_;
  }

  const std::vector<std::unique_ptr<ForceRuleEvaluator>>& getEvaluators() const
  {
    return evaluators_;
  }

  const std::vector<std::unique_ptr<WindZone>>& getWindZones() const
  {
    return windZones_;
  }

  /**
   * @brief Time passed to the last update, or nullopt before the first one
   */
  std::optional<std::chrono::milliseconds> getLastUpdateTime() const
  {
    return lastUpdateTime_;
  }

private:
  // Declared first so it is destroyed after the components referencing it
  WorldModel worldModel_;
  InputState inputState_;

  std::vector<std::unique_ptr<ForceRuleEvaluator>> evaluators_;
  std::vector<std::unique_ptr<WindZone>> windZones_;

  std::optional<std::chrono::milliseconds> lastUpdateTime_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_ENGINE_HPP
