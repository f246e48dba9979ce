#pragma once
#include <vector>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace movecount::model {

// Board + state with make/unmake. A plain value type: copying a Position gives an
// independent scratch position.
class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  // Applies a pseudo-legal move. Returns false and leaves the position untouched if the
  // move is malformed or leaves the mover's king attacked.
  bool doMove(const Move& m);
  void undoMove();

  // Side to move is attacked.
  bool inCheck() const;
  bool isKingAttacked(core::Color c) const;

  std::size_t plyCount() const noexcept { return m_history.size(); }

  // Same placement and state; history is ignored.
  friend bool operator==(const Position& a, const Position& b) noexcept {
    return a.m_board == b.m_board && a.m_state == b.m_state;
  }

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;

  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
};

}  // namespace movecount::model
