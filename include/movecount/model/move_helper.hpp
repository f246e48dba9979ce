#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace movecount::model {

// ---------------- Attack query ----------------
[[nodiscard]] MOVECOUNT_ALWAYS_INLINE bool attackedBy(const Board& b, core::Square sq,
                                                      core::Color by, bb::Bitboard occ) noexcept {
  const bb::Bitboard target = bb::sq_bb(sq);
  const bb::Bitboard occ2 = occ & ~target;  // do not let the target piece block rays

  // Pawns: squares from which a pawn of 'by' attacks 'sq'
  if (bb::pawn_attacks(~by, target) & b.getPieces(by, core::PieceType::Pawn)) return true;

  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight)) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King)) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  const bb::Bitboard bq = b.getPieces(by, core::PieceType::Bishop) | q;
  if (bq && (bb::bishop_attacks(sq, occ2) & bq)) return true;

  const bb::Bitboard rq = b.getPieces(by, core::PieceType::Rook) | q;
  if (rq && (bb::rook_attacks(sq, occ2) & rq)) return true;

  return false;
}

[[nodiscard]] MOVECOUNT_ALWAYS_INLINE core::Square kingSquare(const Board& b,
                                                              core::Color c) noexcept {
  return bb::lsb_square(b.getPieces(c, core::PieceType::King));
}

}  // namespace movecount::model
