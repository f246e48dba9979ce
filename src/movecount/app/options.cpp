#include "movecount/app/options.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "movecount/constants.hpp"

namespace movecount::app {

[[noreturn]] static void usage_and_exit(int code) {
  std::cerr
      << "Usage: movecount [options]\n"
         "Options:\n"
         "  --games <file>            PGN file with the source games (default data/games.pgn)\n"
         "  --weights <file>          JSON weight index (default data/weights.json)\n"
         "  --questions <list>        Comma separated question types, each\n"
         "                            mover|opponent - moves|checks|captures\n"
         "                            (default mover-checks,mover-captures,\n"
         "                             opponent-checks,opponent-captures)\n"
         "  --ply-ahead <N>           Half-moves shown before the scored position (default 0)\n"
         "  --side <white|black|random>  Side to move on the shown board (default random)\n"
         "  --time <seconds>          Time budget per session (default 180)\n"
         "  --no-timer                Hide the timer (unbounded time)\n"
         "  --seed <u64>              RNG seed (default nondeterministic)\n"
         "  --version                 Print version and exit\n"
         "  --help                    Show this text\n";
  std::exit(code);
}

static std::vector<quiz::QuestionType> parse_question_list(const std::string& list) {
  std::vector<quiz::QuestionType> out;
  std::istringstream iss(list);
  std::string item;
  while (std::getline(iss, item, ',')) {
    if (item.empty()) continue;
    const auto qt = quiz::parseQuestionType(item);
    if (!qt) {
      std::cerr << "Unknown question type '" << item << "'\n";
      usage_and_exit(1);
    }
    out.push_back(*qt);
  }
  if (out.empty()) {
    std::cerr << "--questions needs at least one question type\n";
    usage_and_exit(1);
  }
  return out;
}

Options parseArgs(int argc, char** argv) {
  Options o;

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(1);
    }
    return argv[++i];
  };

  auto require_number = [&](int& i, const char* name, auto convert) {
    const std::string v = require_value(i, name);
    try {
      return convert(v);
    } catch (const std::logic_error&) {
      std::cerr << "Bad value '" << v << "' for " << name << "\n";
      usage_and_exit(1);
    }
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      usage_and_exit(0);
    } else if (arg == "--version") {
      std::cout << core::MOVECOUNT_VERSION << "\n";
      std::exit(0);
    } else if (arg == "--games") {
      o.gamesPath = require_value(i, "--games");
    } else if (arg == "--weights") {
      o.weightsPath = require_value(i, "--weights");
    } else if (arg == "--questions") {
      o.quiz.questionTypes = parse_question_list(require_value(i, "--questions"));
    } else if (arg == "--ply-ahead") {
      o.quiz.plyAhead =
          require_number(i, "--ply-ahead", [](const std::string& s) { return std::stoi(s); });
      if (o.quiz.plyAhead < 0) {
        std::cerr << "--ply-ahead must be non-negative\n";
        usage_and_exit(1);
      }
    } else if (arg == "--side") {
      const std::string v = require_value(i, "--side");
      if (v == "white") {
        o.quiz.sideSelection = quiz::SideSelection::White;
      } else if (v == "black") {
        o.quiz.sideSelection = quiz::SideSelection::Black;
      } else if (v == "random") {
        o.quiz.sideSelection = quiz::SideSelection::Random;
      } else {
        std::cerr << "Unknown side '" << v << "'\n";
        usage_and_exit(1);
      }
    } else if (arg == "--time") {
      o.quiz.defaultTimeSeconds =
          require_number(i, "--time", [](const std::string& s) { return std::stod(s); });
      if (!(o.quiz.defaultTimeSeconds > 0.0)) {
        std::cerr << "--time must be positive\n";
        usage_and_exit(1);
      }
    } else if (arg == "--no-timer") {
      o.quiz.showTimer = false;
    } else if (arg == "--seed") {
      o.quiz.seed = require_number(i, "--seed", [](const std::string& s) {
        return static_cast<std::uint64_t>(std::stoull(s));
      });
    } else {
      std::cerr << "Unknown option " << arg << "\n";
      usage_and_exit(1);
    }
  }
  return o;
}

}  // namespace movecount::app
