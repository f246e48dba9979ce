#pragma once

#include <cstddef>
#include <vector>

#include "movecount/corpus/weight_index.hpp"
#include "random_source.hpp"

namespace movecount::quiz
{
  struct SampledPly
  {
    std::size_t game = 0;
    int ply = 0;

    friend bool operator==(const SampledPly &, const SampledPly &) = default;
  };

  // Weighted, parity-constrained selection of a (game, ply) pair.
  class PositionSampler
  {
  public:
    explicit PositionSampler(RandomSource &rng) : m_rng(rng) {}

    // Even ply = White to move. Consumes exactly one random draw.
    // Throws EmptyPartition when no entry has the requested parity or their total weight is
    // not positive.
    SampledPly sample(const std::vector<corpus::WeightEntry> &weights, bool requireWhiteToMove);

  private:
    RandomSource &m_rng;
  };
} // namespace movecount::quiz
