#pragma once

#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "board_renderer.hpp"
#include "movecount/quiz/quiz_session.hpp"

namespace movecount::app {

// Line-oriented front-end. Every command runs under 'serial', the same mutex the tick
// scheduler takes, so commands and ticks never interleave.
class QuizConsole {
 public:
  QuizConsole(quiz::QuizSession& session, BoardRenderer& renderer, std::mutex& serial,
              std::ostream& out);

  // Starts a session and reads commands until "quit" or end of input.
  int run(std::istream& in);

  // Returns false on "quit".
  bool handleLine(const std::string& line);

  // "White  Black" table of the moves leading to the scored position.
  static std::string movesTable(const std::vector<std::string>& moves, bool blackFirst);

 private:
  quiz::QuizSession& m_session;
  BoardRenderer& m_renderer;
  std::mutex& m_serial;
  std::ostream& m_out;
  bool m_endAnnounced = false;

  void startSession();
  void showPuzzle();
  void showQuestions();
  void showStatus();
  void showAnswers();
  void showHelp();
  void announceEndIfNeeded();

  void cmdAnswer(const std::vector<std::string>& tokens);
  void cmdHighlight(const std::vector<std::string>& tokens);
};

}  // namespace movecount::app
