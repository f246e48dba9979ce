#include "movecount/quiz/highlight_map.hpp"

namespace movecount::quiz
{
  bool SquareHighlight::duplicated() const
  {
    for (const auto &[piece, n] : pieces)
      if (n >= 2)
        return true;
    return false;
  }

  int SquareHighlight::total() const
  {
    int n = 0;
    for (const auto &[piece, count] : pieces)
      n += count;
    return n;
  }

  HighlightMap buildHighlightMap(const std::vector<Target> &targets)
  {
    HighlightMap map;
    for (const auto &t : targets)
    {
      if (!core::validSquare(t.square) || t.piece == core::PieceType::None)
        continue;
      ++map[t.square].pieces[t.piece];
    }
    return map;
  }
} // namespace movecount::quiz
