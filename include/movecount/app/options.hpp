#pragma once

#include <string>

#include "movecount/quiz/quiz_config.hpp"

namespace movecount::app {

struct Options {
  std::string gamesPath = "data/games.pgn";
  std::string weightsPath = "data/weights.json";
  quiz::QuizConfig quiz;
};

// Prints usage and exits on --help or a malformed argument.
Options parseArgs(int argc, char** argv);

}  // namespace movecount::app
