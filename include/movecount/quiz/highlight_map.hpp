#pragma once

#include <map>
#include <vector>

#include "answer_engine.hpp"

namespace movecount::quiz
{
  struct SquareHighlight
  {
    std::map<core::PieceType, int> pieces; // piece kind -> number of moves landing here

    // A piece kind reaches the square by two or more moves.
    bool duplicated() const;
    // Only one piece kind reaches the square.
    bool singleKind() const { return pieces.size() == 1; }
    int total() const;
  };

  using HighlightMap = std::map<core::Square, SquareHighlight>;

  HighlightMap buildHighlightMap(const std::vector<Target> &targets);
} // namespace movecount::quiz
