#include "movecount/quiz/position_sampler.hpp"

#include <iostream>

#include "movecount/quiz/quiz_error.hpp"

namespace movecount::quiz
{
  SampledPly PositionSampler::sample(const std::vector<corpus::WeightEntry> &weights,
                                     bool requireWhiteToMove)
  {
    std::vector<const corpus::WeightEntry *> filtered;
    filtered.reserve(weights.size());
    double total = 0.0;
    for (const auto &e : weights)
    {
      const bool whiteToMove = (e.ply % 2) == 0;
      if (whiteToMove != requireWhiteToMove)
        continue;
      filtered.push_back(&e);
      total += e.weight;
    }

    if (filtered.empty())
      throw EmptyPartition(std::string("no weight entries with ") +
                           (requireWhiteToMove ? "White" : "Black") + " to move");
    if (!(total > 0.0))
      throw EmptyPartition("weight entries for the requested side have no positive total weight");

    double threshold = m_rng.uniform() * total;

    // Stable scan in index order; rounding can leave the threshold at ~0 after the last
    // entry, in which case the last entry is taken.
    const corpus::WeightEntry *chosen = filtered.back();
    for (const auto *e : filtered)
    {
      threshold -= e->weight;
      if (threshold < 0.0)
      {
        chosen = e;
        break;
      }
    }

    std::cerr << "[PositionSampler] selected game=" << chosen->game << " ply=" << chosen->ply
              << " weight=" << chosen->weight << "\n";
    return SampledPly{chosen->game, chosen->ply};
  }
} // namespace movecount::quiz
