#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "movecount/corpus/position_corpus.hpp"
#include "movecount/model/analysis/game_record.hpp"
#include "movecount/model/position.hpp"

namespace movecount::quiz
{
  // Board state reached by replaying a game transcript to a ply.
  struct Snapshot
  {
    model::Position position;
    std::string fen;
    std::size_t game = 0;
    int ply = 0;
    std::vector<std::string> history; // SAN of plies 0..ply-1

    core::Color sideToMove() const noexcept { return position.getState().sideToMove; }
  };

  class GameReconstructor
  {
  public:
    explicit GameReconstructor(const corpus::PositionCorpus &corpus) : m_corpus(corpus) {}

    // Replays plies 0..ply-1. Throws ReplayError on a bad game index, a transcript that does
    // not parse, a move that cannot be applied or a ply past the end of the game.
    Snapshot materialize(std::size_t game, int ply);

    // materialize(game, max(0, ply - plyAhead))
    Snapshot preview(std::size_t game, int ply, int plyAhead);

    // SAN of the plies between the preview and the scored position.
    std::vector<std::string> previewMoves(std::size_t game, int ply, int plyAhead);

    // Number of plies in the transcript.
    std::size_t length(std::size_t game);

  private:
    const corpus::PositionCorpus &m_corpus;
    std::unordered_map<std::size_t, model::analysis::GameRecord> m_records;

    const model::analysis::GameRecord &record(std::size_t game);
  };
} // namespace movecount::quiz
