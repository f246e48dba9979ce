#include "movecount/quiz/quiz_session.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "movecount/constants.hpp"
#include "movecount/quiz/quiz_error.hpp"

namespace movecount::quiz
{
  const char *phaseName(Phase p) noexcept
  {
    switch (p)
    {
    case Phase::Idle:
      return "idle";
    case Phase::Loading:
      return "loading";
    case Phase::Active:
      return "active";
    case Phase::Ended:
      return "ended";
    }
    return "?";
  }

  QuizSession::QuizSession(const corpus::PositionCorpus &corpus, TickScheduler &scheduler,
                           QuizConfig config, std::unique_ptr<RandomSource> rng)
      : m_corpus(corpus),
        m_scheduler(scheduler),
        m_config(std::move(config)),
        m_rng(rng ? std::move(rng) : std::make_unique<DefaultRandomSource>(m_config.seed)),
        m_sampler(*m_rng),
        m_reconstructor(corpus)
  {
  }

  QuizSession::~QuizSession()
  {
    m_timer.cancel();
  }

  void QuizSession::resolveSides()
  {
    switch (m_config.sideSelection)
    {
    case SideSelection::White:
      m_playerToMove = core::Color::White;
      break;
    case SideSelection::Black:
      m_playerToMove = core::Color::Black;
      break;
    case SideSelection::Random:
      m_playerToMove = m_rng->coinFlip() ? core::Color::White : core::Color::Black;
      break;
    }
    const int ahead = std::max(0, m_config.plyAhead);
    m_playerToMoveAfter = (ahead % 2 == 0) ? m_playerToMove : ~m_playerToMove;
  }

  void QuizSession::start()
  {
    m_timer.cancel();
    resolveSides();

    m_state = QuizSessionState{};
    m_state.plyAhead = std::max(0, m_config.plyAhead);
    m_lastError.clear();

    loadPuzzle();

    m_state.timeRemaining =
        m_config.showTimer ? m_config.defaultTimeSeconds : std::numeric_limits<double>::infinity();
    m_timer = m_scheduler.schedule(std::chrono::milliseconds(core::TICK_INTERVAL_MS),
                                   [this]
                                   { tick(); });

    std::cerr << "[QuizSession] started: " << core::colorName(m_playerToMove) << " to move, "
              << m_state.plyAhead << " plies ahead, " << m_state.activeQuestionTypes.size()
              << " questions\n";
  }

  void QuizSession::applyConfig(QuizConfig config)
  {
    m_config = std::move(config);
    start();
  }

  void QuizSession::loadPuzzle()
  {
    if (m_loading)
      throw std::logic_error("puzzle load already in progress");
    m_loading = true;
    m_state.phase = Phase::Loading;

    Puzzle puzzle;
    std::map<QuestionType, AnswerRecord> answers;
    std::vector<QuestionType> active;
    try
    {
      puzzle.source = m_sampler.sample(m_corpus.weights(),
                                       m_playerToMoveAfter == core::Color::White);
      puzzle.scored = m_reconstructor.materialize(puzzle.source.game, puzzle.source.ply);
      puzzle.preview =
          m_reconstructor.preview(puzzle.source.game, puzzle.source.ply, m_state.plyAhead);
      const std::size_t from = static_cast<std::size_t>(puzzle.preview.ply);
      puzzle.previewMoves.assign(puzzle.scored.history.begin() + static_cast<std::ptrdiff_t>(from),
                                 puzzle.scored.history.end());
      puzzle.mover = puzzle.scored.sideToMove();

      active = inDisplayOrder(m_config.questionTypes, puzzle.mover);
      std::vector<QuestionType> wanted = active;
      wanted.push_back(questionFor(core::Color::White, Kind::AllLegal, puzzle.mover));
      wanted.push_back(questionFor(core::Color::Black, Kind::AllLegal, puzzle.mover));
      answers = m_engine.answerAll(puzzle.scored, wanted);
    }
    catch (const QuizError &e)
    {
      m_loading = false;
      m_lastError = e.what();
      std::cerr << "[QuizSession] puzzle load failed: " << e.what() << "\n";
      end("load failed");
      throw;
    }

    // commit
    m_state.puzzle = std::move(puzzle);
    m_state.answers = std::move(answers);
    m_state.activeQuestionTypes = std::move(active);
    m_state.correctness.clear();
    for (const auto &qt : m_state.activeQuestionTypes)
      m_state.correctness[qt] = false;

    m_loading = false;
    m_state.phase = Phase::Active;
    std::cerr << "[QuizSession] puzzle game=" << m_state.puzzle->source.game
              << " ply=" << m_state.puzzle->source.ply << " fen=" << m_state.puzzle->scored.fen
              << "\n";
  }

  void QuizSession::tick()
  {
    if (m_state.phase != Phase::Active)
      return;
    m_state.timeRemaining = std::max(0.0, m_state.timeRemaining - 1.0);
    if (m_state.timeRemaining <= 0.0)
      end("time is up");
  }

  void QuizSession::penalize()
  {
    m_state.timeRemaining = std::max(0.0, m_state.timeRemaining - core::WRONG_ANSWER_PENALTY);
    if (m_state.timeRemaining <= 0.0 && !m_state.ended)
      end("time is up");
  }

  SubmitResult QuizSession::submit(const std::map<QuestionType, std::optional<int>> &counts)
  {
    SubmitResult result;
    if (m_state.phase != Phase::Active)
      return result;
    result.accepted = true;

    for (const auto &qt : m_state.activeQuestionTypes)
    {
      const auto it = counts.find(qt);
      const bool correct =
          it != counts.end() && it->second && *it->second == m_state.answers.at(qt).count;
      result.feedback.push_back(QuestionFeedback{qt, correct});

      if (correct && !m_state.correctness[qt])
      {
        m_state.correctness[qt] = true;
        ++m_state.score;
        ++result.scoreGained;
      }
      if (!correct)
        penalize();
    }

    if (m_state.ended)
    {
      result.ended = true;
      return result;
    }

    const bool allCorrect =
        std::all_of(m_state.correctness.begin(), m_state.correctness.end(),
                    [](const auto &kv)
                    { return kv.second; });
    if (allCorrect)
    {
      loadPuzzle();
      result.advanced = true;
    }
    return result;
  }

  void QuizSession::reveal()
  {
    if (m_state.phase == Phase::Idle || m_state.phase == Phase::Ended)
      return;
    end("answers revealed");
  }

  void QuizSession::end(const char *reason)
  {
    m_state.ended = true;
    m_state.phase = Phase::Ended;
    m_timer.cancel();
    std::cerr << "[QuizSession] ended (" << reason << "), score " << m_state.score << "\n";
  }

  const AnswerRecord &QuizSession::answerFor(core::Color color, Kind kind)
  {
    if (!m_state.puzzle)
      throw std::logic_error("no puzzle loaded");
    const QuestionType qt = questionFor(color, kind, m_state.puzzle->mover);
    auto it = m_state.answers.find(qt);
    if (it == m_state.answers.end())
      it = m_state.answers.emplace(qt, m_engine.answer(m_state.puzzle->scored, qt)).first;
    return it->second;
  }
} // namespace movecount::quiz
