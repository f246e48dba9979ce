#include "movecount/model/move_generator.hpp"

#include <cstdint>

#include "movecount/model/move_helper.hpp"

namespace movecount::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

using PT = core::PieceType;

constexpr PT promoOrder[4] = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

struct SideSets {
  bb::Bitboard pawns, knights, bishops, rooks, queens, king, all;
};

MOVECOUNT_ALWAYS_INLINE SideSets side_sets(const Board& b, Color c) noexcept {
  return SideSets{b.getPieces(c, PT::Pawn),  b.getPieces(c, PT::Knight),
                  b.getPieces(c, PT::Bishop), b.getPieces(c, PT::Rook),
                  b.getPieces(c, PT::Queen),  b.getPieces(c, PT::King),
                  b.getPieces(c)};
}

MOVECOUNT_ALWAYS_INLINE void emitPawnTo(Square from, Square to, bool capture, bool promo,
                                        std::vector<Move>& out) {
  if (promo) {
    for (PT pt : promoOrder) out.emplace_back(from, to, pt, capture);
  } else {
    out.emplace_back(from, to, PT::None, capture);
  }
}

// ---------------- Piece generators ----------------

void genPawnMoves(const Board& board, const GameState& st, Color side, const SideSets& our,
                  bb::Bitboard enemyNoKing, std::vector<Move>& out) {
  if (!our.pawns) return;

  const bool W = (side == Color::White);
  const int fwd = W ? 8 : -8;
  const bb::Bitboard empty = ~board.getAllPieces();
  const bb::Bitboard promoRank = W ? bb::RANK_8 : bb::RANK_1;

  // Pushes
  const bb::Bitboard one = (W ? bb::north(our.pawns) : bb::south(our.pawns)) & empty;
  const bb::Bitboard dbl = W ? (bb::north(one & bb::RANK_3) & empty)
                             : (bb::south(one & bb::RANK_6) & empty);

  for (bb::Bitboard q = one; q;) {
    const Square to = bb::pop_lsb(q);
    const Square from = static_cast<Square>(to - fwd);
    emitPawnTo(from, to, false, (bb::sq_bb(to) & promoRank) != 0, out);
  }
  for (bb::Bitboard q = dbl; q;) {
    const Square to = bb::pop_lsb(q);
    out.emplace_back(static_cast<Square>(to - 2 * fwd), to);
  }

  // Captures (kings are never capture targets)
  for (bb::Bitboard p = our.pawns; p;) {
    const Square from = bb::pop_lsb(p);
    bb::Bitboard caps = bb::pawn_attacks(side, bb::sq_bb(from)) & enemyNoKing;
    while (caps) {
      const Square to = bb::pop_lsb(caps);
      emitPawnTo(from, to, true, (bb::sq_bb(to) & promoRank) != 0, out);
    }
  }

  // En passant: the square must be empty and the pawn that just passed must be there
  const Square ep = st.enPassantSquare;
  if (ep != core::NO_SQUARE && core::validSquare(ep)) {
    const bb::Bitboard epBB = bb::sq_bb(ep);
    const int epRank = bb::rank_of(ep);
    if ((epBB & empty) && epRank == (W ? 5 : 2)) {
      const Square victim = static_cast<Square>(ep - fwd);
      const auto vp = board.getPiece(victim);
      if (vp && vp->type == PT::Pawn && vp->color == ~side) {
        bb::Bitboard from = bb::pawn_attacks(~side, epBB) & our.pawns;
        while (from) out.emplace_back(bb::pop_lsb(from), ep, PT::None, true, true);
      }
    }
  }
}

void genPieceMoves(const Board& board, PT pt, bb::Bitboard pieces, bb::Bitboard own,
                   bb::Bitboard enemyNoKing, std::vector<Move>& out) {
  const bb::Bitboard occ = board.getAllPieces();
  const bb::Bitboard empty = ~occ;
  while (pieces) {
    const Square from = bb::pop_lsb(pieces);
    bb::Bitboard atk = 0;
    switch (pt) {
      case PT::Knight:
        atk = bb::knight_attacks_from(from);
        break;
      case PT::Bishop:
        atk = bb::bishop_attacks(from, occ);
        break;
      case PT::Rook:
        atk = bb::rook_attacks(from, occ);
        break;
      case PT::Queen:
        atk = bb::queen_attacks(from, occ);
        break;
      case PT::King:
        atk = bb::king_attacks_from(from);
        break;
      default:
        break;
    }
    atk &= ~own;

    for (bb::Bitboard c = atk & enemyNoKing; c;)
      out.emplace_back(from, bb::pop_lsb(c), PT::None, true);
    for (bb::Bitboard q = atk & empty; q;) out.emplace_back(from, bb::pop_lsb(q));
  }
}

void genCastling(const Board& board, const GameState& st, Color side, std::vector<Move>& out) {
  const bool W = (side == Color::White);
  const Square ksq = W ? bb::E1 : bb::E8;
  const auto king = board.getPiece(ksq);
  if (!king || king->type != PT::King || king->color != side) return;

  const bb::Bitboard occ = board.getAllPieces();
  const Color them = ~side;

  auto rookAt = [&](Square sq) {
    const auto r = board.getPiece(sq);
    return r && r->type == PT::Rook && r->color == side;
  };
  auto safe = [&](Square sq) { return !attackedBy(board, sq, them, occ); };

  const std::uint8_t kRight = W ? bb::Castling::WK : bb::Castling::BK;
  const std::uint8_t qRight = W ? bb::Castling::WQ : bb::Castling::BQ;

  if (st.castlingRights & kRight) {
    const Square f = W ? bb::F1 : bb::F8;
    const Square g = W ? bb::G1 : bb::G8;
    const Square h = W ? bb::H1 : bb::H8;
    const bool pathEmpty = !(occ & (bb::sq_bb(f) | bb::sq_bb(g)));
    if (rookAt(h) && pathEmpty && safe(ksq) && safe(f) && safe(g))
      out.emplace_back(ksq, g, PT::None, false, false, CastleSide::KingSide);
  }
  if (st.castlingRights & qRight) {
    const Square d = W ? bb::D1 : bb::D8;
    const Square c = W ? bb::C1 : bb::C8;
    const Square b = W ? bb::B1 : bb::B8;
    const Square a = W ? bb::A1 : bb::A8;
    const bool pathEmpty = !(occ & (bb::sq_bb(d) | bb::sq_bb(c) | bb::sq_bb(b)));
    if (rookAt(a) && pathEmpty && safe(ksq) && safe(d) && safe(c))
      out.emplace_back(ksq, c, PT::None, false, false, CastleSide::QueenSide);
  }
}

void generate(const Board& b, const GameState& st, std::vector<Move>& out) {
  const Color side = st.sideToMove;
  const SideSets our = side_sets(b, side);
  const bb::Bitboard enemyNoKing = b.getPieces(~side) & ~b.getPieces(~side, PT::King);

  genPawnMoves(b, st, side, our, enemyNoKing, out);
  genPieceMoves(b, PT::Knight, our.knights, our.all, enemyNoKing, out);
  genPieceMoves(b, PT::Bishop, our.bishops, our.all, enemyNoKing, out);
  genPieceMoves(b, PT::Rook, our.rooks, our.all, enemyNoKing, out);
  genPieceMoves(b, PT::Queen, our.queens, our.all, enemyNoKing, out);
  genPieceMoves(b, PT::King, our.king, our.all, enemyNoKing, out);
  genCastling(b, st, side, out);
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st,
                                             std::vector<Move>& out) const {
  out.clear();
  generate(b, st, out);
}

}  // namespace movecount::model
