#ifndef IMPETUS_SIM_WIND_ZONE_CONFIG_HPP
#define IMPETUS_SIM_WIND_ZONE_CONFIG_HPP

namespace impetus_sim
{

/**
 * @brief Wind zone settings
 *
 * Without variation the zone pushes with baseForce. With variation the
 * magnitude follows a noise signal between minForce and baseForce.
 * minForce <= baseForce is expected but not enforced.
 */
struct WindZoneConfig
{
  double baseForce{10.0};          // [N], maximum when useVariation is set
  bool useVariation{false};
  double variationFrequency{1.0};  // Noise samples per second of sim time
  double minForce{0.0};            // [N]
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_WIND_ZONE_CONFIG_HPP
