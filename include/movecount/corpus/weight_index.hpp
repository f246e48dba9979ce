#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace movecount::corpus
{
  // One selectable (game, ply) pair and its relative weight.
  struct WeightEntry
  {
    std::size_t game = 0;
    int ply = 0;
    double weight = 0.0;

    friend bool operator==(const WeightEntry &, const WeightEntry &) = default;
  };

  // JSON array of {"game": int, "ply": int, "weight": number}. Throws CorpusError when the
  // document does not parse or an entry lacks a field. Negative game indices are skipped.
  std::vector<WeightEntry> loadWeightIndex(const std::string &jsonText);
  std::vector<WeightEntry> loadWeightIndexFile(const std::string &path);
} // namespace movecount::corpus
