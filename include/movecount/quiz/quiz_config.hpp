#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "movecount/constants.hpp"
#include "question_type.hpp"

namespace movecount::quiz
{
  enum class SideSelection : std::uint8_t
  {
    White,
    Black,
    Random
  };

  struct QuizConfig
  {
    std::vector<QuestionType> questionTypes{
        {Perspective::Mover, Kind::Checks},
        {Perspective::Mover, Kind::Captures},
        {Perspective::Opponent, Kind::Checks},
        {Perspective::Opponent, Kind::Captures},
    };
    int plyAhead = 0;
    SideSelection sideSelection = SideSelection::Random;
    double defaultTimeSeconds = core::DEFAULT_TIME_SECONDS;
    bool showTimer = true;
    std::optional<std::uint64_t> seed;
  };
} // namespace movecount::quiz
