#ifndef IMPETUS_SIM_WIND_ZONE_HPP
#define IMPETUS_SIM_WIND_ZONE_HPP

#include <cstdint>
#include <memory>

#include "impetus-sim/src/DataTypes/ForceVector.hpp"
#include "impetus-sim/src/Environment/TriggerEvent.hpp"
#include "impetus-sim/src/Forces/ForceVisualization.hpp"
#include "impetus-sim/src/Forces/WindZoneConfig.hpp"
#include "impetus-sim/src/Noise/NoiseSource.hpp"

namespace impetus_sim
{

class WorldModel;

/**
 * @brief Pushes every dynamic body inside a trigger volume along the
 *        volume's forward axis
 *
 * The force is applied at the body's centre of mass each step the body
 * overlaps the volume. With variation enabled the magnitude follows a noise
 * signal sampled at elapsed * variationFrequency, mapped linearly onto
 * [minForce, baseForce].
 *
 * Usage:
 * @code
 * WindZoneConfig gusty;
 * gusty.baseForce = 60.0;
 * gusty.useVariation = true;
 * gusty.minForce = 20.0;
 *
 * WindZone tunnel{world, tunnelVolume.getInstanceId(), gusty};
 * tunnel.update(elapsedSeconds);
 * world.step(dt);
 * @endcode
 */
class WindZone : public TriggerListener
{
public:
  /**
   * @param world World owning the trigger volume
   * @param triggerId Instance id of the trigger volume defining the zone
   * @param config Force settings
   * @param noise Variation signal; a PerlinNoise1D is used when null
   * @throws std::invalid_argument if triggerId is not a trigger volume
   */
  WindZone(WorldModel& world,
           uint32_t triggerId,
           WindZoneConfig config,
           std::shared_ptr<const NoiseSource> noise = nullptr);

  ~WindZone() override;

  WindZone(const WindZone&) = delete;
  WindZone& operator=(const WindZone&) = delete;
  WindZone(WindZone&&) = delete;
  WindZone& operator=(WindZone&&) = delete;

  /**
   * @brief Resample the variation signal
   * @param elapsedSeconds Simulation time since start [s]
   *
   * Does nothing to the magnitude when variation is disabled.
   */
  void update(double elapsedSeconds);

  void onTriggerStay(const TriggerEvent& event) override;

  /**
   * @brief Magnitude currently applied to overlapping bodies [N]
   */
  [[nodiscard]] double getCurrentForce() const;

  /**
   * @brief Last noise sample in [0, 1], 0 before the first update
   */
  [[nodiscard]] double getNoiseValue() const
  {
    return noiseValue_;
  }

  /**
   * @brief Force currently applied to each overlapping body
   */
  [[nodiscard]] ForceVector getForceVector() const;

  /**
   * @brief Arrow from the zone centre along its forward axis
   *
   * active is true if a body was pushed since the last update().
   */
  [[nodiscard]] ForceVisualization visualize() const;

  [[nodiscard]] const WindZoneConfig& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] uint32_t getTriggerId() const
  {
    return triggerId_;
  }

private:
  WorldModel& world_;
  uint32_t triggerId_;
  WindZoneConfig config_;
  std::shared_ptr<const NoiseSource> noise_;

  double noiseValue_{0.0};
  double currentForce_;
  bool pushed_{false};
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_WIND_ZONE_HPP
