#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "weight_index.hpp"

namespace movecount::corpus
{
  // Game transcripts plus the weight index over (game, ply) pairs. Read-only after loading.
  class PositionCorpus
  {
  public:
    // Throws CorpusError on unreadable files, zero transcripts, a malformed weight index or
    // an index without usable entries.
    static PositionCorpus loadFromFiles(const std::string &pgnPath, const std::string &weightsPath);

    // In-memory corpus; applies the same entry sanity checks.
    static PositionCorpus fromData(std::vector<std::string> games, std::vector<WeightEntry> weights);

    std::size_t gameCount() const noexcept { return m_games.size(); }
    const std::string &transcript(std::size_t game) const; // throws std::out_of_range
    const std::vector<std::string> &games() const noexcept { return m_games; }
    const std::vector<WeightEntry> &weights() const noexcept { return m_weights; }

  private:
    std::vector<std::string> m_games;
    std::vector<WeightEntry> m_weights;
  };
} // namespace movecount::corpus
