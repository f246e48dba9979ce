#include "movecount/model/chess_game.hpp"

#include <algorithm>
#include <stdexcept>

#include "movecount/model/fen.hpp"

namespace movecount::model {

namespace {

// "e2" at offset i, NO_SQUARE when out of range or malformed.
core::Square coordAt(const std::string& s, std::size_t i) {
  if (i + 2 > s.size()) return core::NO_SQUARE;
  const int file = s[i] - 'a';
  const int rank = s[i + 1] - '1';
  if (file < 0 || file > 7 || rank < 0 || rank > 7) return core::NO_SQUARE;
  return static_cast<core::Square>(rank * 8 + file);
}

bool promotionFromChar(char c, core::PieceType& out) {
  switch (c) {
    case 'q': case 'Q': out = core::PieceType::Queen; return true;
    case 'r': case 'R': out = core::PieceType::Rook; return true;
    case 'b': case 'B': out = core::PieceType::Bishop; return true;
    case 'n': case 'N': out = core::PieceType::Knight; return true;
    default: return false;
  }
}

}  // namespace

ChessGame::ChessGame() {
  m_pseudo_moves.reserve(128);
  m_legal_moves.reserve(128);
  if (!parseFen(core::START_FEN, m_position)) throw std::logic_error("start FEN does not parse");
}

bool ChessGame::setPosition(const std::string& fen, std::string* err) {
  Position parsed;
  if (!parseFen(fen, parsed, err)) return false;
  setPosition(parsed);
  return true;
}

void ChessGame::setPosition(const Position& pos) {
  m_position = pos;
  m_pseudo_moves.clear();
  m_legal_moves.clear();
}

bool ChessGame::doMoveUCI(const std::string& uciMove) {
  if (uciMove.size() != 4 && uciMove.size() != 5) return false;
  const core::Square from = coordAt(uciMove, 0);
  const core::Square to = coordAt(uciMove, 2);
  if (!core::validSquare(from) || !core::validSquare(to)) return false;

  core::PieceType promo = core::PieceType::None;
  if (uciMove.size() == 5 && !promotionFromChar(uciMove[4], promo)) return false;
  return doMove(from, to, promo);
}

std::optional<Move> ChessGame::getMove(core::Square from, core::Square to,
                                       core::PieceType promotion) {
  const auto& legals = generateLegalMoves();
  const auto it = std::find_if(legals.begin(), legals.end(), [&](const Move& m) {
    return m.from() == from && m.to() == to && m.promotion() == promotion;
  });
  if (it == legals.end()) return std::nullopt;
  return *it;
}

bool ChessGame::doMove(core::Square from, core::Square to, core::PieceType promotion) {
  const auto m = getMove(from, to, promotion);
  return m && m_position.doMove(*m);
}

bool ChessGame::doMove(const Move& m) {
  // re-resolve so that flags always come from the generator
  return doMove(m.from(), m.to(), m.promotion());
}

const std::vector<Move>& ChessGame::generateLegalMoves() {
  m_legal_moves.clear();
  m_move_gen.generatePseudoLegalMoves(m_position.getBoard(), m_position.getState(), m_pseudo_moves);

  for (const auto& m : m_pseudo_moves) {
    if (!m_position.doMove(m)) continue;
    m_position.undoMove();
    m_legal_moves.push_back(m);
  }
  return m_legal_moves;
}

const GameState& ChessGame::getGameState() const {
  return m_position.getState();
}

std::optional<bb::Piece> ChessGame::getPiece(core::Square sq) const {
  if (!core::validSquare(sq)) return std::nullopt;
  return m_position.getBoard().getPiece(sq);
}

bool ChessGame::isKingInCheck(core::Color side) const {
  return m_position.isKingAttacked(side);
}

std::string ChessGame::getFen() const {
  return toFen(m_position);
}

}  // namespace movecount::model
