#pragma once

#include <string>
#include <string_view>

namespace movecount::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Quiz defaults
  constexpr double DEFAULT_TIME_SECONDS = 180.0;
  constexpr double WRONG_ANSWER_PENALTY = 10.0;
  constexpr int TICK_INTERVAL_MS = 1000;

  // ------------------ Version ------------------
  inline constexpr std::string_view MOVECOUNT_VERSION{"movecount 1.0"};
}
