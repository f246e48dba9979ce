#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "movecount/constants.hpp"
#include "movecount/model/fen.hpp"
#include "movecount/quiz/answer_engine.hpp"
#include "movecount/quiz/quiz_error.hpp"

using namespace movecount;
using quiz::Kind;
using quiz::Perspective;
using quiz::QuestionType;

namespace
{
  const std::string KIWIPETE =
      "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";
  const std::string POSITION_3 = "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1";
  const std::string SCHOLAR =
      "r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4";
  const std::string ONLY_CHECK = "4k3/b7/5P2/8/8/7p/7P/7K w - - 0 1";
  const std::string EN_PASSANT =
      "rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3";

  constexpr QuestionType MOVER_ALL{Perspective::Mover, Kind::AllLegal};
  constexpr QuestionType MOVER_CHECKS{Perspective::Mover, Kind::Checks};
  constexpr QuestionType MOVER_CAPTURES{Perspective::Mover, Kind::Captures};
  constexpr QuestionType OPP_CHECKS{Perspective::Opponent, Kind::Checks};
  constexpr QuestionType OPP_CAPTURES{Perspective::Opponent, Kind::Captures};

  bool contains(const std::vector<std::string> &v, const std::string &s)
  {
    return std::find(v.begin(), v.end(), s) != v.end();
  }

  core::Color sideOf(const std::string &fen)
  {
    model::Position pos;
    const bool ok = model::parseFen(fen, pos);
    assert(ok);
    return pos.getState().sideToMove;
  }
} // namespace

int main()
{
  const quiz::AnswerEngine engine;

  // Initial position
  {
    assert(engine.answerFen(core::START_FEN, MOVER_ALL).count == 20);
    assert(engine.answerFen(core::START_FEN, MOVER_CHECKS).count == 0);
    assert(engine.answerFen(core::START_FEN, MOVER_CAPTURES).count == 0);
    assert(engine.answerFen(core::START_FEN, OPP_CAPTURES).count == 0);
  }

  // A single legal move which gives check
  {
    const auto all = engine.answerFen(ONLY_CHECK, MOVER_ALL);
    assert(all.count == 1);
    assert(all.moves.front() == "f7+");

    const auto checks = engine.answerFen(ONLY_CHECK, MOVER_CHECKS);
    assert(checks.count == 1);
    assert(checks.targets.size() == 1);
    assert((checks.targets[0] == quiz::Target{static_cast<core::Square>(53), core::PieceType::Pawn}));
    assert(engine.answerFen(ONLY_CHECK, MOVER_CAPTURES).count == 0);
  }

  // Reference counts
  {
    assert(engine.answerFen(KIWIPETE, MOVER_ALL).count == 48);
    assert(engine.answerFen(KIWIPETE, MOVER_CAPTURES).count == 8);
    assert(engine.answerFen(KIWIPETE, MOVER_CHECKS).count == 0);

    assert(engine.answerFen(POSITION_3, MOVER_ALL).count == 14);
    assert(engine.answerFen(POSITION_3, MOVER_CAPTURES).count == 1);
    assert(engine.answerFen(POSITION_3, MOVER_CHECKS).count == 2);
  }

  // Both sides of a middlegame position
  {
    const auto checks = engine.answerFen(SCHOLAR, MOVER_CHECKS);
    assert(checks.count == 3);
    assert(contains(checks.moves, "Qxf7#"));
    assert(contains(checks.moves, "Bxf7+"));
    assert(contains(checks.moves, "Qxe5+"));

    const auto captures = engine.answerFen(SCHOLAR, MOVER_CAPTURES);
    assert(captures.count == 4);
    assert(contains(captures.moves, "Qxh7"));
    // f7 is hit twice and reported twice
    assert(std::count(captures.targets.begin(), captures.targets.end(),
                      quiz::Target{static_cast<core::Square>(53), core::PieceType::Queen}) == 1);
    assert(std::count(captures.targets.begin(), captures.targets.end(),
                      quiz::Target{static_cast<core::Square>(53), core::PieceType::Bishop}) == 1);

    const auto oppCaptures = engine.answerFen(SCHOLAR, OPP_CAPTURES);
    assert(oppCaptures.count == 2);
    assert(contains(oppCaptures.moves, "Nxe4"));
    assert(contains(oppCaptures.moves, "Nxh5"));
    assert(engine.answerFen(SCHOLAR, OPP_CHECKS).count == 0);
  }

  // En passant counts as a capture; the flipped position ignores the stale square
  {
    const auto captures = engine.answerFen(EN_PASSANT, MOVER_CAPTURES);
    assert(captures.count == 1);
    assert(captures.moves.front() == "exf6");
    assert(captures.targets.front().square == static_cast<core::Square>(45));

    assert(engine.answerFen(EN_PASSANT, OPP_CAPTURES).count == 0);
    assert(engine.answerFen(EN_PASSANT, {Perspective::Opponent, Kind::AllLegal}).count > 0);
  }

  // Checks and captures are subsets of the legal moves; counts match the lists
  for (const auto &fen : {core::START_FEN, KIWIPETE, POSITION_3, SCHOLAR, ONLY_CHECK, EN_PASSANT})
  {
    for (auto p : {Perspective::Mover, Perspective::Opponent})
    {
      const auto all = engine.answerFen(fen, {p, Kind::AllLegal});
      assert(all.count == static_cast<int>(all.moves.size()));
      for (auto k : {Kind::Checks, Kind::Captures})
      {
        const auto sub = engine.answerFen(fen, {p, k});
        assert(sub.count == static_cast<int>(sub.moves.size()));
        assert(sub.targets.size() == sub.moves.size());
        assert(sub.count <= all.count);
        for (const auto &m : sub.moves)
          assert(contains(all.moves, m));
      }
    }
  }

  // Opponent answers equal mover answers of the side-flipped FEN
  for (const auto &fen : {core::START_FEN, KIWIPETE, POSITION_3, SCHOLAR})
  {
    const std::string other = model::withSideToMove(fen, ~sideOf(fen));
    for (auto k : {Kind::AllLegal, Kind::Checks, Kind::Captures})
    {
      const auto a = engine.answerFen(fen, {Perspective::Opponent, k});
      const auto b = engine.answerFen(other, {Perspective::Mover, k});
      assert(a.count == b.count);
      assert(a.moves == b.moves);
    }
  }

  // Flipping keeps everything except the side to move
  {
    model::Position pos;
    assert(model::parseFen(KIWIPETE, pos));
    const auto f = quiz::AnswerEngine::flipped(pos);
    assert(f.getState().sideToMove == core::Color::Black);
    assert(f.getState().castlingRights == pos.getState().castlingRights);
    assert(f.getBoard() == pos.getBoard());
    assert(quiz::AnswerEngine::flipped(f) == pos);
  }

  // Enumeration details
  {
    model::Position pos;
    assert(model::parseFen(EN_PASSANT, pos));
    const auto details = quiz::AnswerEngine::enumerate(pos);
    const auto ep = std::find_if(details.begin(), details.end(),
                                 [](const quiz::MoveDetail &d) { return d.enPassant; });
    assert(ep != details.end());
    assert(ep->piece == core::PieceType::Pawn);
    assert(ep->san == "exf6");
  }

  // Invalid input
  {
    bool thrown = false;
    try
    {
      engine.answerFen(core::START_FEN, QuestionType{Perspective::Mover, static_cast<Kind>(7)});
    }
    catch (const quiz::InvalidQuestionType &)
    {
      thrown = true;
    }
    assert(thrown);

    thrown = false;
    try
    {
      engine.answerFen("not a fen", MOVER_ALL);
    }
    catch (const std::invalid_argument &)
    {
      thrown = true;
    }
    assert(thrown);
  }

  std::cout << "answer_engine_test passed\n";
  return 0;
}
