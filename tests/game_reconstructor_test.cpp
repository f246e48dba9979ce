#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "movecount/constants.hpp"
#include "movecount/corpus/position_corpus.hpp"
#include "movecount/model/analysis/pgn_reader.hpp"
#include "movecount/model/fen.hpp"
#include "movecount/model/position.hpp"
#include "movecount/quiz/game_reconstructor.hpp"
#include "movecount/quiz/quiz_error.hpp"

using namespace movecount;

namespace
{
  const std::string SCHOLAR = "[Event \"Scholar\"]\n[Result \"1-0\"]\n\n"
                              "1. e4 e5 2. Bc4 Nc6 3. Qh5 Nf6 4. Qxf7# 1-0";
  const std::string PROMOTION = "[Event \"Promotion\"]\n\n"
                                "1. e4 d5 2. e5 f5 3. exf6 e6 4. fxg7 Bd6 5. gxh8=Q Qh4 "
                                "6. Qxg8+ Ke7 7. Qxh7+ *";
  const std::string FROM_FEN = "[Event \"Endgame\"]\n[SetUp \"1\"]\n"
                               "[FEN \"4k3/8/8/8/8/8/4P3/4K3 w - - 0 1\"]\n\n"
                               "1. e4 Kd7 2. Kd2 *";

  template <class F>
  bool throwsReplayError(F &&f)
  {
    try
    {
      f();
    }
    catch (const quiz::ReplayError &)
    {
      return true;
    }
    return false;
  }
} // namespace

int main()
{
  const auto corpus = corpus::PositionCorpus::fromData(
      {SCHOLAR, PROMOTION, FROM_FEN, "1. e4 e5 2. Ke3 *", "garbage ]]]"}, {{0, 0, 1.0}});
  quiz::GameReconstructor rec(corpus);

  // Ply 0 is the starting position
  {
    const auto s = rec.materialize(0, 0);
    assert(s.fen == core::START_FEN);
    assert(s.history.empty());
    assert(s.sideToMove() == core::Color::White);

    const auto e = rec.materialize(2, 0);
    assert(e.fen == "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");
  }

  // Known position before the mate
  {
    const auto s = rec.materialize(0, 6);
    assert(s.fen == "r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4");
    assert((s.history == std::vector<std::string>{"e4", "e5", "Bc4", "Nc6", "Qh5", "Nf6"}));
    assert(s.game == 0 && s.ply == 6);
    assert(rec.length(0) == 7);

    const auto mate = rec.materialize(0, 7);
    assert(mate.history.back() == "Qxf7#");
    assert(mate.sideToMove() == core::Color::Black);
    assert(mate.position.inCheck());
  }

  // En passant, promotion and check suffixes in the history
  {
    const auto s = rec.materialize(1, 13);
    assert(s.history.size() == 13);
    assert(s.history[4] == "exf6");
    assert(s.history[6] == "fxg7");
    assert(s.history[8] == "gxh8=Q");
    assert(s.history[10] == "Qxg8+");
    assert(s.history[12] == "Qxh7+");
    assert(s.position.inCheck());
  }

  // Every prefix agrees with a direct make-move replay
  for (std::size_t g = 0; g < 3; ++g)
  {
    model::analysis::GameRecord record;
    assert(model::analysis::parsePgnToRecord(corpus.transcript(g), record));
    model::Position pos;
    assert(model::parseFen(record.startFen, pos));

    for (std::size_t k = 0; k <= record.plies.size(); ++k)
    {
      const auto s = rec.materialize(g, static_cast<int>(k));
      assert(s.position == pos);
      assert(s.fen == model::toFen(pos));
      if (k < record.plies.size())
      {
        const bool ok = pos.doMove(record.plies[k]);
        assert(ok);
      }
    }
  }

  // Preview plies
  {
    const auto p = rec.preview(0, 6, 2);
    assert(p.ply == 4);
    assert(p.sideToMove() == core::Color::White);
    assert((rec.previewMoves(0, 6, 2) == std::vector<std::string>{"Qh5", "Nf6"}));

    const auto same = rec.preview(0, 6, 0);
    assert(same.fen == rec.materialize(0, 6).fen);
    assert(rec.previewMoves(0, 6, 0).empty());

    const auto clamped = rec.preview(0, 1, 3);
    assert(clamped.ply == 0);
    assert(clamped.fen == core::START_FEN);
    assert((rec.previewMoves(0, 1, 3) == std::vector<std::string>{"e4"}));
  }

  // Failures
  {
    assert(throwsReplayError([&] { rec.materialize(99, 0); }));
    assert(throwsReplayError([&] { rec.materialize(0, 8); }));
    assert(throwsReplayError([&] { rec.materialize(0, -1); }));
    assert(throwsReplayError([&] { rec.materialize(3, 1); }));
    assert(throwsReplayError([&] { rec.materialize(4, 0); }));
    assert(throwsReplayError([&] { rec.length(3); }));
  }

  // Every entry of the bundled corpus replays
  {
    const auto bundled =
        corpus::PositionCorpus::loadFromFiles(std::string(MOVECOUNT_DATA_DIR) + "/games.pgn",
                                              std::string(MOVECOUNT_DATA_DIR) + "/weights.json");
    quiz::GameReconstructor r(bundled);
    for (const auto &e : bundled.weights())
    {
      const auto s = r.materialize(e.game, e.ply);
      assert(s.sideToMove() == ((e.ply % 2 == 0) ? core::Color::White : core::Color::Black));
    }
  }

  std::cout << "game_reconstructor_test passed\n";
  return 0;
}
