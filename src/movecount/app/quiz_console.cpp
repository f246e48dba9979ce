#include "movecount/app/quiz_console.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>

#include "movecount/quiz/quiz_error.hpp"

namespace movecount::app {

static std::vector<std::string> split_ws(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

// Non-negative integer or nullopt; anything else is a malformed answer.
static std::optional<int> parse_count(const std::string& s) {
  if (s.empty() || s.size() > 6) return std::nullopt;
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + (c - '0');
  }
  return v;
}

static std::string format_time(double t) {
  if (std::isinf(t)) return "--:--";
  const int total = static_cast<int>(t);
  std::ostringstream os;
  os << std::setw(2) << std::setfill('0') << total / 60 << ':' << std::setw(2)
     << std::setfill('0') << total % 60;
  return os.str();
}

QuizConsole::QuizConsole(quiz::QuizSession& session, BoardRenderer& renderer, std::mutex& serial,
                         std::ostream& out)
    : m_session(session), m_renderer(renderer), m_serial(serial), m_out(out) {}

std::string QuizConsole::movesTable(const std::vector<std::string>& moves, bool blackFirst) {
  std::ostringstream os;
  os << "Compute counts after these moves:\n";
  os << "  " << std::left << std::setw(10) << "White" << "Black\n";

  std::size_t i = 0;
  if (blackFirst && !moves.empty()) {
    os << "  " << std::setw(10) << "" << moves[0] << "\n";
    i = 1;
  }
  for (; i < moves.size(); i += 2) {
    os << "  " << std::setw(10) << moves[i];
    if (i + 1 < moves.size()) os << moves[i + 1];
    os << "\n";
  }
  return os.str();
}

int QuizConsole::run(std::istream& in) {
  {
    std::lock_guard<std::mutex> lk(m_serial);
    startSession();
  }

  std::string line;
  while (true) {
    m_out << "> " << std::flush;
    if (!std::getline(in, line)) break;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::lock_guard<std::mutex> lk(m_serial);
    announceEndIfNeeded();
    if (!handleLine(line)) break;
    announceEndIfNeeded();
  }

  std::lock_guard<std::mutex> lk(m_serial);
  m_session.stopTimer();
  m_out << "Final score: " << m_session.state().score << "\n";
  return 0;
}

void QuizConsole::startSession() {
  m_endAnnounced = false;
  m_renderer.clearHighlights();
  try {
    m_session.start();
  } catch (const quiz::QuizError& e) {
    std::cerr << "[Console] cannot start a puzzle: " << e.what() << "\n";
    m_out << "No playable puzzle: " << e.what() << "\n";
    m_endAnnounced = true;
    return;
  }
  showPuzzle();
}

bool QuizConsole::handleLine(const std::string& line) {
  const auto tokens = split_ws(line);
  if (tokens.empty()) return true;
  const std::string& cmd = tokens[0];

  if (cmd == "quit" || cmd == "exit") return false;

  if (cmd == "answer" || cmd == "a") {
    cmdAnswer(tokens);
  } else if (cmd == "reveal") {
    m_session.reveal();
  } else if (cmd == "new") {
    startSession();
  } else if (cmd == "highlight") {
    cmdHighlight(tokens);
  } else if (cmd == "clear") {
    m_renderer.clearHighlights();
    showPuzzle();
  } else if (cmd == "board") {
    showPuzzle();
  } else if (cmd == "status") {
    showStatus();
  } else if (cmd == "help") {
    showHelp();
  } else {
    m_out << "Unknown command '" << cmd << "' (try 'help')\n";
  }
  return true;
}

void QuizConsole::cmdAnswer(const std::vector<std::string>& tokens) {
  if (m_session.phase() != quiz::Phase::Active) {
    m_out << "The session has ended. Type 'new' to play again.\n";
    return;
  }

  const auto& active = m_session.activeInDisplayOrder();
  std::map<quiz::QuestionType, std::optional<int>> counts;
  for (std::size_t i = 0; i < active.size(); ++i)
    counts[active[i]] = (i + 1 < tokens.size()) ? parse_count(tokens[i + 1]) : std::nullopt;

  quiz::SubmitResult res;
  try {
    res = m_session.submit(counts);
  } catch (const quiz::QuizError& e) {
    m_out << "No playable puzzle: " << e.what() << "\n";
    m_endAnnounced = true;
    return;
  }
  if (!res.accepted) return;

  const core::Color mover = m_session.playerToMoveAfter();
  for (const auto& fb : res.feedback) {
    m_out << "  " << std::left << std::setw(18)
          << quiz::label(quiz::colorFor(fb.type, mover), fb.type.kind)
          << (fb.correct ? "correct" : "wrong") << "\n";
  }
  m_out << "Score: " << m_session.state().score
        << "  Time: " << format_time(m_session.state().timeRemaining) << "\n";

  if (res.advanced) {
    m_out << "All correct, next puzzle.\n";
    m_renderer.clearHighlights();
    showPuzzle();
  }
}

void QuizConsole::cmdHighlight(const std::vector<std::string>& tokens) {
  if (tokens.size() != 3) {
    m_out << "Usage: highlight <white|black> <moves|checks|captures>\n";
    return;
  }
  core::Color color;
  if (tokens[1] == "white") {
    color = core::Color::White;
  } else if (tokens[1] == "black") {
    color = core::Color::Black;
  } else {
    m_out << "Unknown side '" << tokens[1] << "'\n";
    return;
  }
  const auto kind = quiz::parseKind(tokens[2]);
  if (!kind) {
    m_out << "Unknown kind '" << tokens[2] << "'\n";
    return;
  }
  if (!m_session.state().puzzle) {
    m_out << "No puzzle loaded.\n";
    return;
  }

  const auto& answer = m_session.answerFor(color, *kind);
  m_renderer.showHighlights(quiz::buildHighlightMap(answer.targets), color);
}

void QuizConsole::showPuzzle() {
  const auto& st = m_session.state();
  if (!st.puzzle) return;

  m_renderer.setFlipped(m_session.playerToMove() == core::Color::Black);
  m_renderer.show(st.puzzle->preview.fen);

  if (!st.puzzle->previewMoves.empty())
    m_out << movesTable(st.puzzle->previewMoves,
                        st.puzzle->preview.sideToMove() == core::Color::Black);
  showQuestions();
}

void QuizConsole::showQuestions() {
  const core::Color mover = m_session.playerToMoveAfter();
  const auto& st = m_session.state();
  m_out << "Count (answer in this order):\n";
  int n = 1;
  for (const auto& qt : m_session.activeInDisplayOrder()) {
    m_out << "  " << n++ << ". " << quiz::label(quiz::colorFor(qt, mover), qt.kind);
    const auto it = st.correctness.find(qt);
    if (it != st.correctness.end() && it->second) m_out << "  (solved)";
    m_out << "\n";
  }
}

void QuizConsole::showStatus() {
  const auto& st = m_session.state();
  m_out << "Phase: " << quiz::phaseName(st.phase) << "  Score: " << st.score
        << "  Time: " << format_time(st.timeRemaining) << "\n";
  if (st.puzzle)
    m_out << "Game " << st.puzzle->source.game << ", ply " << st.puzzle->source.ply << "\n";
}

void QuizConsole::showAnswers() {
  const auto& st = m_session.state();
  if (!st.puzzle) return;
  const core::Color mover = st.puzzle->mover;
  for (const auto& qt : st.activeQuestionTypes) {
    const auto& rec = st.answers.at(qt);
    m_out << "  " << quiz::label(quiz::colorFor(qt, mover), qt.kind) << ": " << rec.count;
    if (!rec.moves.empty()) {
      m_out << " (";
      for (std::size_t i = 0; i < rec.moves.size(); ++i) {
        if (i) m_out << ", ";
        m_out << rec.moves[i];
      }
      m_out << ")";
    }
    m_out << "\n";
  }
}

void QuizConsole::showHelp() {
  m_out << "Commands:\n"
           "  answer <n> <n> ...     one count per question, in the order shown\n"
           "  reveal                 end the session and show the answers\n"
           "  new                    start a new session\n"
           "  highlight <white|black> <moves|checks|captures>\n"
           "  clear                  remove highlights\n"
           "  board                  show the board and questions again\n"
           "  status                 score, time and phase\n"
           "  quit\n";
}

void QuizConsole::announceEndIfNeeded() {
  if (m_endAnnounced || m_session.phase() != quiz::Phase::Ended) return;
  m_endAnnounced = true;

  const auto& st = m_session.state();
  if (st.timeRemaining <= 0.0)
    m_out << "Time is up!\n";
  m_out << "Session over. Score: " << st.score << "\n";
  if (!m_session.lastError().empty()) {
    m_out << "No playable puzzle: " << m_session.lastError() << "\n";
    return;
  }
  m_out << "Answers:\n";
  showAnswers();
}

}  // namespace movecount::app
