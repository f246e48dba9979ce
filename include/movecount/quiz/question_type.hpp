#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "movecount/chess_types.hpp"

namespace movecount::quiz
{
  enum class Perspective : std::uint8_t
  {
    Mover = 0,
    Opponent = 1
  };

  enum class Kind : std::uint8_t
  {
    AllLegal = 0,
    Checks = 1,
    Captures = 2
  };

  struct QuestionType
  {
    Perspective perspective = Perspective::Mover;
    Kind kind = Kind::AllLegal;

    bool isValid() const noexcept
    {
      return static_cast<std::uint8_t>(perspective) <= 1 && static_cast<std::uint8_t>(kind) <= 2;
    }

    friend auto operator<=>(const QuestionType &, const QuestionType &) = default;
  };

  // Absolute colour whose moves the question counts, given the side to move at the scored
  // position.
  constexpr core::Color colorFor(QuestionType qt, core::Color mover) noexcept
  {
    return qt.perspective == Perspective::Mover ? mover : ~mover;
  }

  constexpr QuestionType questionFor(core::Color color, Kind kind, core::Color mover) noexcept
  {
    return QuestionType{color == mover ? Perspective::Mover : Perspective::Opponent, kind};
  }

  // Fixed display order: White then Black, AllLegal -> Checks -> Captures.
  struct DisplaySlot
  {
    core::Color color;
    Kind kind;
  };
  inline constexpr std::array<DisplaySlot, 6> DISPLAY_ORDER{{
      {core::Color::White, Kind::AllLegal},
      {core::Color::White, Kind::Checks},
      {core::Color::White, Kind::Captures},
      {core::Color::Black, Kind::AllLegal},
      {core::Color::Black, Kind::Checks},
      {core::Color::Black, Kind::Captures},
  }};

  // The active types sorted through DISPLAY_ORDER for the given mover; duplicates dropped.
  std::vector<QuestionType> inDisplayOrder(const std::vector<QuestionType> &active, core::Color mover);

  const char *kindName(Kind k) noexcept;        // "moves", "checks", "captures"
  std::string label(core::Color color, Kind k); // "White's moves"
  std::string toString(QuestionType qt);        // "mover-checks"

  // Parses "mover-checks", "opponent-moves", ... (case-insensitive).
  std::optional<QuestionType> parseQuestionType(std::string_view text);
  std::optional<Kind> parseKind(std::string_view text);
} // namespace movecount::quiz

template <>
struct std::hash<movecount::quiz::QuestionType>
{
  std::size_t operator()(const movecount::quiz::QuestionType &qt) const noexcept
  {
    return (static_cast<std::size_t>(qt.perspective) << 4) | static_cast<std::size_t>(qt.kind);
  }
};
