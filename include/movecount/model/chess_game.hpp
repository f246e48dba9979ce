#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace movecount::model {

class ChessGame {
 public:
  ChessGame();

  // Returns false (and keeps the previous position) on a malformed FEN.
  bool setPosition(const std::string& fen, std::string* err = nullptr);
  void setPosition(const Position& pos);

  bool doMove(core::Square from, core::Square to,
              core::PieceType promotion = core::PieceType::None);
  bool doMove(const Move& m);
  bool doMoveUCI(const std::string& uciMove);

  std::optional<bb::Piece> getPiece(core::Square sq) const;
  const GameState& getGameState() const;
  const std::vector<Move>& generateLegalMoves();
  std::optional<Move> getMove(core::Square from, core::Square to,
                              core::PieceType promotion = core::PieceType::None);

  bool isKingInCheck(core::Color side) const;
  const Position& getPosition() const { return m_position; }

  std::string getFen() const;

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  std::vector<Move> m_pseudo_moves;
  std::vector<Move> m_legal_moves;
};

}  // namespace movecount::model
