#include "movecount/model/position.hpp"

#include <array>
#include <utility>

#include "movecount/model/move_helper.hpp"

namespace movecount::model {

namespace {

// Castling rights lost when a move touches the square (from or to).
constexpr std::array<std::uint8_t, 64> kRightsLost = [] {
  std::array<std::uint8_t, 64> a{};
  a[bb::E1] = bb::Castling::WK | bb::Castling::WQ;
  a[bb::E8] = bb::Castling::BK | bb::Castling::BQ;
  a[bb::H1] = bb::Castling::WK;
  a[bb::A1] = bb::Castling::WQ;
  a[bb::H8] = bb::Castling::BK;
  a[bb::A8] = bb::Castling::BQ;
  return a;
}();

// Rook origin and destination for a castle of the given side.
std::pair<core::Square, core::Square> rookPath(core::Color side, CastleSide cs) {
  const bool white = side == core::Color::White;
  if (cs == CastleSide::KingSide) return white ? std::pair{bb::H1, bb::F1} : std::pair{bb::H8, bb::F8};
  return white ? std::pair{bb::A1, bb::D1} : std::pair{bb::A8, bb::D8};
}

// Square behind the pawn that made a double push, NO_SQUARE otherwise.
core::Square skippedSquare(core::Color side, core::Square from, core::Square to) {
  const int fromRank = bb::rank_of(from);
  const int toRank = bb::rank_of(to);
  if (side == core::Color::White && fromRank == 1 && toRank == 3)
    return static_cast<core::Square>(from + 8);
  if (side == core::Color::Black && fromRank == 6 && toRank == 4)
    return static_cast<core::Square>(from - 8);
  return core::NO_SQUARE;
}

bool promotesLegally(core::Color side, core::Square to, core::PieceType promo) {
  const int lastRank = side == core::Color::White ? 7 : 0;
  if (bb::rank_of(to) != lastRank) return false;
  switch (promo) {
    case core::PieceType::Queen:
    case core::PieceType::Rook:
    case core::PieceType::Bishop:
    case core::PieceType::Knight:
      return true;
    default:
      return false;
  }
}

}  // namespace

bool Position::isKingAttacked(core::Color c) const {
  const core::Square king = kingSquare(m_board, c);
  return king != core::NO_SQUARE && attackedBy(m_board, king, ~c, m_board.getAllPieces());
}

bool Position::inCheck() const { return isKingAttacked(m_state.sideToMove); }

bool Position::doMove(const Move& m) {
  if (m.from() == m.to()) return false;

  const core::Color side = m_state.sideToMove;
  const auto moving = m_board.getPiece(m.from());
  if (!moving || moving->color != side) return false;

  if (const auto victim = m_board.getPiece(m.to())) {
    if (victim->color == side || victim->type == core::PieceType::King) return false;
  }

  if (m.promotion() != core::PieceType::None &&
      (moving->type != core::PieceType::Pawn || !promotesLegally(side, m.to(), m.promotion())))
    return false;

  StateInfo undo{};
  undo.move = m;
  undo.prevCastlingRights = m_state.castlingRights;
  undo.prevEnPassantSquare = m_state.enPassantSquare;
  undo.prevHalfmoveClock = m_state.halfmoveClock;
  applyMove(m, undo);

  if (isKingAttacked(side)) {
    unapplyMove(undo);
    return false;
  }
  m_history.push_back(undo);
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  unapplyMove(m_history.back());
  m_history.pop_back();
}

void Position::applyMove(const Move& m, StateInfo& undo) {
  const core::Color side = m_state.sideToMove;
  const bool pawnMove = m_board.getPiece(m.from())->type == core::PieceType::Pawn;

  undo.captured = bb::Piece{core::PieceType::None, ~side};
  undo.capturedOn = m.isEnPassant()
                        ? static_cast<core::Square>(side == core::Color::White ? m.to() - 8
                                                                               : m.to() + 8)
                        : m.to();
  if (const auto taken = m_board.getPiece(undo.capturedOn)) {
    undo.captured = *taken;
    m_board.removePiece(undo.capturedOn);
  }

  m_board.movePiece(m.from(), m.to());
  if (m.promotion() != core::PieceType::None) m_board.setPiece(m.to(), {m.promotion(), side});
  if (m.isCastle()) {
    const auto [rookFrom, rookTo] = rookPath(side, m.castle());
    m_board.movePiece(rookFrom, rookTo);
  }

  m_state.halfmoveClock = (pawnMove || !undo.captured.isNone()) ? 0 : m_state.halfmoveClock + 1;
  m_state.enPassantSquare = pawnMove ? skippedSquare(side, m.from(), m.to()) : core::NO_SQUARE;
  m_state.castlingRights &= ~(kRightsLost[m.from()] | kRightsLost[m.to()]);
  m_state.sideToMove = ~side;
  if (side == core::Color::Black) ++m_state.fullmoveNumber;
}

void Position::unapplyMove(const StateInfo& undo) {
  const Move& m = undo.move;
  const core::Color side = ~m_state.sideToMove;

  m_state.sideToMove = side;
  if (side == core::Color::Black) --m_state.fullmoveNumber;
  m_state.castlingRights = undo.prevCastlingRights;
  m_state.enPassantSquare = undo.prevEnPassantSquare;
  m_state.halfmoveClock = undo.prevHalfmoveClock;

  if (m.isCastle()) {
    const auto [rookFrom, rookTo] = rookPath(side, m.castle());
    m_board.movePiece(rookTo, rookFrom);
  }
  m_board.movePiece(m.to(), m.from());
  if (m.promotion() != core::PieceType::None)
    m_board.setPiece(m.from(), {core::PieceType::Pawn, side});
  if (!undo.captured.isNone()) m_board.setPiece(undo.capturedOn, undo.captured);
}

}  // namespace movecount::model
