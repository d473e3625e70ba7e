#include "impetus-sim/src/Noise/PerlinNoise1D.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace impetus_sim
{

namespace
{

double fade(double t)
{
  return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

}  // namespace

PerlinNoise1D::PerlinNoise1D(std::uint32_t seed, int octaves)
  : octaves_{std::max(octaves, 1)}
{
  for (std::size_t i = 0; i < kTableSize; ++i)
  {
    permutation_[i] = static_cast<std::uint8_t>(i);
  }

  std::mt19937 rng{seed};
  for (std::size_t i = kTableSize - 1; i > 0; --i)
  {
    auto const j = static_cast<std::size_t>(rng() % (i + 1));
    std::swap(permutation_[i], permutation_[j]);
  }
}

double PerlinNoise1D::sample(double x) const
{
  double sum = 0.0;
  double amplitude = 1.0;
  double totalAmplitude = 0.0;
  double frequency = 1.0;

  for (int octave = 0; octave < octaves_; ++octave)
  {
    sum += amplitude * gradientNoise(x * frequency);
    totalAmplitude += amplitude;
    amplitude *= 0.5;
    frequency *= 2.0;
  }

  // Remap [-0.5, 0.5] to [0, 1]; clamp absorbs rounding at the extremes
  return std::clamp(sum / totalAmplitude + 0.5, 0.0, 1.0);
}

double PerlinNoise1D::gradientNoise(double x) const
{
  double const cell = std::floor(x);
  auto const lattice = static_cast<std::int64_t>(cell);
  double const t = x - cell;

  double const d0 = gradient(lattice) * t;
  double const d1 = gradient(lattice + 1) * (t - 1.0);
  double const f = fade(t);
  return d0 + f * (d1 - d0);
}

double PerlinNoise1D::gradient(std::int64_t lattice) const
{
  // Two table lookups decorrelate neighbouring cells
  auto const index = static_cast<std::size_t>(lattice & 0xFF);
  std::uint8_t const hash =
    permutation_[(permutation_[index] + index) & 0xFF];

  // 256 evenly spaced gradients in [-1, 1]
  return static_cast<double>(hash) / 127.5 - 1.0;
}

}  // namespace impetus_sim
