#pragma once
#include <cstdint>
#include <string>

namespace movecount::core
{
  using Square = std::uint8_t;
  constexpr Square NO_SQUARE = 64;

  inline bool validSquare(core::Square sq)
  {
    return sq < core::NO_SQUARE;
  }

  constexpr std::uint8_t NUM_PIECE_TYPES = 6;
  enum class PieceType : std::uint8_t
  {
    Pawn = 0,
    Knight,
    Bishop,
    Rook,
    Queen,
    King,
    None
  };

  constexpr int idx(PieceType p) noexcept
  {
    return static_cast<int>(p);
  }

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };
  constexpr inline core::Color operator~(core::Color c)
  {
    return c == core::Color::White ? core::Color::Black : core::Color::White;
  }

  // "e4" style name, "-" for NO_SQUARE
  inline std::string squareName(Square sq)
  {
    if (!validSquare(sq))
      return "-";
    std::string s;
    s.push_back(static_cast<char>('a' + (sq & 7)));
    s.push_back(static_cast<char>('1' + (sq >> 3)));
    return s;
  }

  // lower-case letter as used in FEN for black pieces ('p', 'n', ...)
  constexpr char pieceChar(PieceType p) noexcept
  {
    switch (p)
    {
    case PieceType::Pawn:
      return 'p';
    case PieceType::Knight:
      return 'n';
    case PieceType::Bishop:
      return 'b';
    case PieceType::Rook:
      return 'r';
    case PieceType::Queen:
      return 'q';
    case PieceType::King:
      return 'k';
    default:
      return '?';
    }
  }

  inline const char *colorName(Color c)
  {
    return c == Color::White ? "White" : "Black";
  }
} // namespace movecount::core
