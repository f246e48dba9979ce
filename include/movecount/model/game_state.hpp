#pragma once
#include <cstdint>
#include <type_traits>

#include "core/bitboard.hpp"
#include "core/model_types.hpp"
#include "move.hpp"

namespace movecount::model {

struct GameState {
  std::uint32_t fullmoveNumber = 1;
  std::uint16_t halfmoveClock = 0;
  std::uint8_t castlingRights =
      bb::Castling::WK | bb::Castling::WQ | bb::Castling::BK | bb::Castling::BQ;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;

  friend bool operator==(const GameState&, const GameState&) = default;
};

// Everything needed to take a move back.
struct StateInfo {
  Move move{};
  bb::Piece captured{};
  core::Square capturedOn{core::NO_SQUARE};

  std::uint16_t prevHalfmoveClock{};
  std::uint8_t prevCastlingRights{};
  core::Square prevEnPassantSquare{core::NO_SQUARE};
};

static_assert((bb::Castling::WK | bb::Castling::WQ | bb::Castling::BK | bb::Castling::BQ) <= 0xF,
              "Castling rights must fit in 4 bits");
static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");
static_assert(std::is_trivially_copyable_v<StateInfo>, "StateInfo should be POD");

}  // namespace movecount::model
