#pragma once
#include <array>
#include <cassert>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace movecount::model {

class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    for (auto& byColor : m_bb) byColor.fill(0);
    m_color_occ = {0, 0};
    m_all_occ = 0;
    m_piece_on.fill(0);
  }

  MOVECOUNT_ALWAYS_INLINE void setPiece(core::Square sq, bb::Piece p) noexcept;
  MOVECOUNT_ALWAYS_INLINE void removePiece(core::Square sq) noexcept;
  MOVECOUNT_ALWAYS_INLINE void movePiece(core::Square from, core::Square to) noexcept;
  MOVECOUNT_ALWAYS_INLINE std::optional<bb::Piece> getPiece(core::Square sq) const noexcept;

  MOVECOUNT_ALWAYS_INLINE bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  MOVECOUNT_ALWAYS_INLINE bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

  MOVECOUNT_ALWAYS_INLINE bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    if (t == core::PieceType::None) return 0;
    return m_bb[bb::ci(c)][core::idx(t)];
  }

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_piece_on == b.m_piece_on;
  }

 private:
  // [color][type 0..5]
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;

  // 0 = empty, else (type+1) | (color<<3)
  std::array<std::uint8_t, 64> m_piece_on{};

  static constexpr std::uint8_t pack(bb::Piece p) noexcept {
    if (p.type == core::PieceType::None) return 0;
    return static_cast<std::uint8_t>((core::idx(p.type) + 1) | (bb::ci(p.color) << 3));
  }
  static constexpr bb::Piece unpack(std::uint8_t packed) noexcept {
    return bb::Piece{static_cast<core::PieceType>((packed & 0x7) - 1),
                     (packed >> 3) & 1u ? core::Color::Black : core::Color::White};
  }
};

MOVECOUNT_ALWAYS_INLINE void Board::setPiece(core::Square sq, bb::Piece p) noexcept {
  assert(core::validSquare(sq));
  removePiece(sq);
  const std::uint8_t packed = pack(p);
  if (!packed) return;

  const bb::Bitboard mask = bb::sq_bb(sq);
  m_bb[bb::ci(p.color)][core::idx(p.type)] |= mask;
  m_color_occ[bb::ci(p.color)] |= mask;
  m_all_occ |= mask;
  m_piece_on[sq] = packed;
}

MOVECOUNT_ALWAYS_INLINE void Board::removePiece(core::Square sq) noexcept {
  assert(core::validSquare(sq));
  const std::uint8_t packed = m_piece_on[sq];
  if (!packed) return;

  const bb::Piece p = unpack(packed);
  const bb::Bitboard mask = bb::sq_bb(sq);
  m_bb[bb::ci(p.color)][core::idx(p.type)] &= ~mask;
  m_color_occ[bb::ci(p.color)] &= ~mask;
  m_all_occ &= ~mask;
  m_piece_on[sq] = 0;
}

// Moves whatever stands on 'from' to 'to', replacing any piece on 'to'.
MOVECOUNT_ALWAYS_INLINE void Board::movePiece(core::Square from, core::Square to) noexcept {
  const std::uint8_t packed = m_piece_on[from];
  if (!packed) return;
  removePiece(from);
  setPiece(to, unpack(packed));
}

MOVECOUNT_ALWAYS_INLINE std::optional<bb::Piece> Board::getPiece(core::Square sq) const noexcept {
  const std::uint8_t packed = m_piece_on[static_cast<int>(sq)];
  if (!packed) return std::nullopt;
  return unpack(packed);
}

}  // namespace movecount::model
