#include "movecount/quiz/game_reconstructor.hpp"

#include <algorithm>

#include "movecount/model/analysis/pgn_reader.hpp"
#include "movecount/model/analysis/san_notation.hpp"
#include "movecount/model/chess_game.hpp"
#include "movecount/quiz/quiz_error.hpp"

namespace movecount::quiz
{
  const model::analysis::GameRecord &GameReconstructor::record(std::size_t game)
  {
    auto it = m_records.find(game);
    if (it != m_records.end())
      return it->second;

    if (game >= m_corpus.gameCount())
      throw ReplayError("game " + std::to_string(game) + " is not in the corpus (" +
                        std::to_string(m_corpus.gameCount()) + " games)");

    model::analysis::GameRecord rec;
    std::string err;
    if (!model::analysis::parsePgnToRecord(m_corpus.transcript(game), rec, &err))
      throw ReplayError("game " + std::to_string(game) + " does not parse: " + err);

    return m_records.emplace(game, std::move(rec)).first->second;
  }

  std::size_t GameReconstructor::length(std::size_t game)
  {
    return record(game).plies.size();
  }

  Snapshot GameReconstructor::materialize(std::size_t game, int ply)
  {
    const auto &rec = record(game);
    if (ply < 0 || static_cast<std::size_t>(ply) > rec.plies.size())
      throw ReplayError("game " + std::to_string(game) + " has " +
                        std::to_string(rec.plies.size()) + " plies, requested " +
                        std::to_string(ply));

    model::ChessGame g;
    std::string err;
    if (!g.setPosition(rec.startFen, &err))
      throw ReplayError("game " + std::to_string(game) + " has a bad start position: " + err);

    Snapshot snap;
    snap.game = game;
    snap.ply = ply;
    snap.history.reserve(static_cast<std::size_t>(ply));

    for (int i = 0; i < ply; ++i)
    {
      const model::Move &mv = rec.plies[static_cast<std::size_t>(i)];
      const auto &legals = g.generateLegalMoves();
      std::string san = model::notation::toSan(g.getPosition(), mv, legals);
      if (san.empty() || !g.doMove(mv))
        throw ReplayError("game " + std::to_string(game) + ": move " + std::to_string(i + 1) +
                          " cannot be applied");
      snap.history.push_back(std::move(san));
    }

    snap.position = g.getPosition();
    snap.fen = g.getFen();
    return snap;
  }

  Snapshot GameReconstructor::preview(std::size_t game, int ply, int plyAhead)
  {
    return materialize(game, std::max(0, ply - std::max(0, plyAhead)));
  }

  std::vector<std::string> GameReconstructor::previewMoves(std::size_t game, int ply, int plyAhead)
  {
    const Snapshot scored = materialize(game, ply);
    const int from = std::max(0, ply - std::max(0, plyAhead));
    return std::vector<std::string>(scored.history.begin() + from, scored.history.end());
  }
} // namespace movecount::quiz
