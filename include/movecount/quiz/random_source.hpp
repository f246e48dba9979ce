#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace movecount::quiz
{
  class RandomSource
  {
  public:
    virtual ~RandomSource() = default;

    // Uniform real in [0, 1).
    virtual double uniform() = 0;

    bool coinFlip() { return uniform() < 0.5; }
  };

  class DefaultRandomSource : public RandomSource
  {
  public:
    // Seeded from std::random_device when no seed is given.
    explicit DefaultRandomSource(std::optional<std::uint64_t> seed = std::nullopt);

    double uniform() override;

  private:
    std::mt19937_64 m_rng;
    std::uniform_real_distribution<double> m_dist{0.0, 1.0};
  };
} // namespace movecount::quiz
