#pragma once

#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace movecount::model {

class MoveGenerator {
 public:
  // Full pseudo-legal move generation (quiet moves + captures + promotions + en passant +
  // castling). Castling is only emitted when the path is empty and the king does not start
  // in, pass through or land on an attacked square. Final legality is verified via doMove().
  void generatePseudoLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;
};

}  // namespace movecount::model
