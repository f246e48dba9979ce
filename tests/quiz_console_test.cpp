#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "movecount/app/options.hpp"
#include "movecount/app/quiz_console.hpp"
#include "movecount/app/text_board_renderer.hpp"
#include "movecount/constants.hpp"
#include "movecount/corpus/position_corpus.hpp"
#include "movecount/quiz/highlight_map.hpp"
#include "movecount/quiz/question_type.hpp"
#include "movecount/quiz/quiz_session.hpp"

using namespace movecount;
using quiz::Kind;
using quiz::Perspective;
using quiz::QuestionType;

namespace
{
  const std::string SCHOLAR = "[Event \"Scholar\"]\n[Result \"1-0\"]\n\n"
                              "1. e4 e5 2. Bc4 Nc6 3. Qh5 Nf6 4. Qxf7# 1-0";

  class FixedRandom : public quiz::RandomSource
  {
  public:
    double uniform() override { return 0.0; }
  };

  bool has(const std::string &haystack, const std::string &needle)
  {
    return haystack.find(needle) != std::string::npos;
  }

  constexpr core::Square sq(char file, int rank)
  {
    return static_cast<core::Square>((file - 'a') + (rank - 1) * 8);
  }
} // namespace

int main()
{
  // Question type names and display order
  {
    const auto qt = quiz::parseQuestionType("Mover-Checks");
    assert(qt && (*qt == QuestionType{Perspective::Mover, Kind::Checks}));
    assert((quiz::parseQuestionType("opponent-all") ==
            QuestionType{Perspective::Opponent, Kind::AllLegal}));
    assert(!quiz::parseQuestionType("mover"));
    assert(!quiz::parseQuestionType("someone-checks"));
    assert(!quiz::parseQuestionType("mover-pins"));
    assert(quiz::toString({Perspective::Opponent, Kind::Captures}) == "opponent-captures");
    assert(quiz::label(core::Color::Black, Kind::AllLegal) == "Black's moves");

    assert(quiz::colorFor({Perspective::Opponent, Kind::Checks}, core::Color::White) ==
           core::Color::Black);
    assert((quiz::questionFor(core::Color::White, Kind::Captures, core::Color::Black) ==
            QuestionType{Perspective::Opponent, Kind::Captures}));

    const quiz::QuizConfig cfg;
    const auto order = quiz::inDisplayOrder(cfg.questionTypes, core::Color::Black);
    assert((order == std::vector<QuestionType>{{Perspective::Opponent, Kind::Checks},
                                               {Perspective::Opponent, Kind::Captures},
                                               {Perspective::Mover, Kind::Checks},
                                               {Perspective::Mover, Kind::Captures}}));

    const std::vector<QuestionType> dup{{Perspective::Mover, Kind::AllLegal},
                                        {Perspective::Mover, Kind::AllLegal}};
    assert(quiz::inDisplayOrder(dup, core::Color::White).size() == 1);
  }

  // Highlight aggregation per square
  {
    const std::vector<quiz::Target> targets{
        {sq('e', 5), core::PieceType::Queen}, {sq('e', 5), core::PieceType::Queen},
        {sq('f', 7), core::PieceType::Queen}, {sq('f', 7), core::PieceType::Bishop},
        {sq('h', 7), core::PieceType::Queen}, {core::NO_SQUARE, core::PieceType::Pawn}};
    const auto map = quiz::buildHighlightMap(targets);
    assert(map.size() == 3);

    const auto &e5 = map.at(sq('e', 5));
    assert(e5.duplicated() && e5.singleKind() && e5.total() == 2);
    const auto &f7 = map.at(sq('f', 7));
    assert(!f7.duplicated() && !f7.singleKind() && f7.total() == 2);
    const auto &h7 = map.at(sq('h', 7));
    assert(!h7.duplicated() && h7.singleKind());

    assert(app::TextBoardRenderer::highlightMarker(e5) == 'Q');
    assert(app::TextBoardRenderer::highlightMarker(f7) == '*');
    assert(app::TextBoardRenderer::highlightMarker(h7) == 'q');
  }

  // Text diagram
  {
    std::ostringstream out;
    app::TextBoardRenderer r(out);
    assert(r.render().empty());

    r.show(core::START_FEN);
    std::string text = r.render();
    assert(has(text, "  8  r n b q k b n r  8\n"));
    assert(has(text, "  1  R N B Q K B N R  1\n"));

    quiz::HighlightMap map;
    map[sq('e', 4)].pieces[core::PieceType::Pawn] = 1;
    r.showHighlights(map, core::Color::White);
    assert(has(r.render(), "  4  . . . .[p . . .  4\n"));
    assert(has(out.str(), "White pieces reaching each square:"));
    assert(has(out.str(), "  e4: P\n"));

    r.clearHighlights();
    r.setFlipped(true);
    text = r.render();
    assert(has(text, "     h g f e d c b a\n"));
    assert(has(text, "  1  R N B K Q B N R  1\n"));
    assert(!has(text, "["));
  }

  // Moves leading to the scored position
  {
    assert(app::QuizConsole::movesTable({"Nf6"}, true) ==
           "Compute counts after these moves:\n"
           "  White     Black\n"
           "            Nf6\n");
    assert(app::QuizConsole::movesTable({"e4", "e5", "Nf3"}, false) ==
           "Compute counts after these moves:\n"
           "  White     Black\n"
           "  e4        e5\n"
           "  Nf3       \n");
  }

  // Command line
  {
    std::vector<std::string> args{"movecount", "--games",     "g.pgn", "--questions",
                                  "mover-moves,opponent-checks", "--ply-ahead", "2",
                                  "--side",    "black",       "--time", "60",
                                  "--no-timer", "--seed",     "7"};
    std::vector<char *> argv;
    for (auto &a : args)
      argv.push_back(a.data());
    const auto o = app::parseArgs(static_cast<int>(argv.size()), argv.data());
    assert(o.gamesPath == "g.pgn");
    assert(o.weightsPath == "data/weights.json");
    assert((o.quiz.questionTypes == std::vector<QuestionType>{
                                        {Perspective::Mover, Kind::AllLegal},
                                        {Perspective::Opponent, Kind::Checks}}));
    assert(o.quiz.plyAhead == 2);
    assert(o.quiz.sideSelection == quiz::SideSelection::Black);
    assert(o.quiz.defaultTimeSeconds == 60.0);
    assert(!o.quiz.showTimer);
    assert(o.quiz.seed && *o.quiz.seed == 7);
  }

  // A scripted console session
  {
    const auto corpus = corpus::PositionCorpus::fromData({SCHOLAR}, {{0, 6, 1.0}});
    quiz::ManualTickScheduler sched;
    quiz::QuizConfig cfg;
    cfg.sideSelection = quiz::SideSelection::White;
    quiz::QuizSession session(corpus, sched, cfg, std::make_unique<FixedRandom>());

    std::ostringstream out;
    app::TextBoardRenderer renderer(out);
    std::mutex serial;
    app::QuizConsole console(session, renderer, serial, out);

    std::istringstream in("status\n"
                          "answer 3 4 0 1\n"
                          "answer 3 4 0 2\n"
                          "highlight white captures\n"
                          "frobnicate\n"
                          "reveal\n"
                          "answer 1 2 3 4\n"
                          "quit\n"
                          "status\n");
    assert(console.run(in) == 0);

    const std::string text = out.str();
    assert(has(text, "1. White's checks"));
    assert(has(text, "4. Black's captures"));
    assert(has(text, "Phase: active  Score: 0  Time: 03:00"));
    assert(has(text, "Black's captures  wrong"));
    assert(has(text, "Score: 3  Time: 02:50"));
    assert(has(text, "All correct, next puzzle."));
    assert(has(text, "f7: B Q"));
    assert(has(text, "e5: Q"));
    assert(has(text, "Unknown command 'frobnicate'"));
    assert(has(text, "Session over. Score: 4"));
    assert(has(text, "White's checks: 3 ("));
    assert(has(text, "The session has ended."));
    assert(has(text, "Final score: 4"));
    assert(!has(text, "Phase: ended"));
    assert(!session.timerActive());
  }

  // Board, clear, help and new reuse the same session
  {
    const auto corpus = corpus::PositionCorpus::fromData({SCHOLAR}, {{0, 6, 1.0}});
    quiz::ManualTickScheduler sched;
    quiz::QuizConfig cfg;
    cfg.sideSelection = quiz::SideSelection::White;
    quiz::QuizSession session(corpus, sched, cfg, std::make_unique<FixedRandom>());

    std::ostringstream out;
    app::TextBoardRenderer renderer(out);
    std::mutex serial;
    app::QuizConsole console(session, renderer, serial, out);

    std::istringstream in("help\n"
                          "board\n"
                          "highlight purple moves\n"
                          "highlight black fish\n"
                          "clear\n"
                          "answer 3 4 0 2\n"
                          "new\n"
                          "status\n"
                          "quit\n");
    assert(console.run(in) == 0);

    const std::string text = out.str();
    assert(has(text, "Commands:"));
    assert(has(text, "Unknown side 'purple'"));
    assert(has(text, "Unknown kind 'fish'"));
    assert(has(text, "Score: 4  Time: 03:00"));
    assert(has(text, "Phase: active  Score: 0  Time: 03:00"));
    assert(has(text, "Final score: 0"));

    std::size_t shown = 0;
    for (auto pos = text.find("Count (answer in this order):"); pos != std::string::npos;
         pos = text.find("Count (answer in this order):", pos + 1))
      ++shown;
    // start, board, clear, advance, new
    assert(shown == 5);
    assert(sched.liveCount() == 0);
  }

  std::cout << "quiz_console_test passed\n";
  return 0;
}
