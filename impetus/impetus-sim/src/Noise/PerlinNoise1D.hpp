#ifndef IMPETUS_SIM_PERLIN_NOISE_1D_HPP
#define IMPETUS_SIM_PERLIN_NOISE_1D_HPP

#include <array>
#include <cstdint>

#include "impetus-sim/src/Noise/NoiseSource.hpp"

namespace impetus_sim
{

/**
 * @brief One-dimensional gradient (Perlin) noise remapped to [0, 1]
 *
 * Each integer lattice point gets a pseudo-random gradient in [-1, 1] picked
 * through a seeded permutation table. Between lattice points the two
 * gradient ramps are blended with the quintic fade 6t⁵ - 15t⁴ + 10t³, which
 * keeps the signal C2-continuous. A single octave lies in [-0.5, 0.5]
 * before the remap, so the output never leaves [0, 1]. Lattice points
 * sample to exactly 0.5.
 *
 * With more than one octave, each octave doubles the frequency and halves
 * the amplitude; the sum is renormalised by the total amplitude.
 *
 * The permutation is built from std::mt19937 with a hand-rolled
 * Fisher-Yates shuffle so the same seed gives the same signal on every
 * standard library.
 */
class PerlinNoise1D final : public NoiseSource
{
public:
  static constexpr std::uint32_t kDefaultSeed = 0;

  /**
   * @param seed Permutation seed
   * @param octaves Number of fractal octaves (values below 1 are treated as 1)
   */
  explicit PerlinNoise1D(std::uint32_t seed = kDefaultSeed, int octaves = 1);

  [[nodiscard]] double sample(double x) const override;

  [[nodiscard]] int getOctaves() const
  {
    return octaves_;
  }

private:
  /**
   * @brief Raw single-octave gradient noise in [-0.5, 0.5]
   */
  [[nodiscard]] double gradientNoise(double x) const;

  [[nodiscard]] double gradient(std::int64_t lattice) const;

  static constexpr std::size_t kTableSize = 256;

  std::array<std::uint8_t, kTableSize> permutation_{};
  int octaves_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PERLIN_NOISE_1D_HPP
