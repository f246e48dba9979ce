#include "movecount/corpus/position_corpus.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "movecount/corpus/corpus_error.hpp"
#include "movecount/corpus/pgn_splitter.hpp"

namespace movecount::corpus
{
  namespace
  {
    std::string readFile(const std::string &path)
    {
      std::ifstream in(path, std::ios::binary);
      if (!in)
        throw CorpusError("cannot open game file '" + path + "'");
      return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
  } // namespace

  PositionCorpus PositionCorpus::loadFromFiles(const std::string &pgnPath,
                                               const std::string &weightsPath)
  {
    std::cerr << "[Corpus] loading games from " << pgnPath << "\n";
    const std::string text = readFile(pgnPath);
    std::cerr << "[Corpus] raw PGN text length " << text.size() << "\n";

    std::vector<std::string> games = splitGames(text);
    std::vector<WeightEntry> weights = loadWeightIndexFile(weightsPath);
    return fromData(std::move(games), std::move(weights));
  }

  PositionCorpus PositionCorpus::fromData(std::vector<std::string> games,
                                          std::vector<WeightEntry> weights)
  {
    if (games.empty())
      throw CorpusError("corpus contains no games");

    PositionCorpus corpus;
    corpus.m_games = std::move(games);
    corpus.m_weights.reserve(weights.size());

    std::size_t skipped = 0;
    for (const auto &e : weights)
    {
      if (e.game >= corpus.m_games.size())
      {
        std::cerr << "[Corpus] skipping entry: game " << e.game << " out of range\n";
        ++skipped;
        continue;
      }
      if (e.ply < 0)
      {
        std::cerr << "[Corpus] skipping entry: game " << e.game << " has negative ply " << e.ply
                  << "\n";
        ++skipped;
        continue;
      }
      if (!(e.weight > 0.0))
      {
        std::cerr << "[Corpus] skipping entry: game " << e.game << " ply " << e.ply
                  << " has non-positive weight\n";
        ++skipped;
        continue;
      }
      corpus.m_weights.push_back(e);
    }

    if (corpus.m_weights.empty())
      throw CorpusError("weight index has no usable entries");

    std::cerr << "[Corpus] " << corpus.m_games.size() << " games, " << corpus.m_weights.size()
              << " weighted positions";
    if (skipped)
      std::cerr << " (" << skipped << " skipped)";
    std::cerr << "\n";
    return corpus;
  }

  const std::string &PositionCorpus::transcript(std::size_t game) const
  {
    if (game >= m_games.size())
      throw std::out_of_range("game index " + std::to_string(game) + " out of range");
    return m_games[game];
  }
} // namespace movecount::corpus
