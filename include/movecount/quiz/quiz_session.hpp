#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "answer_engine.hpp"
#include "game_reconstructor.hpp"
#include "movecount/corpus/position_corpus.hpp"
#include "position_sampler.hpp"
#include "question_type.hpp"
#include "quiz_config.hpp"
#include "random_source.hpp"
#include "tick_scheduler.hpp"

namespace movecount::quiz
{
  enum class Phase : std::uint8_t
  {
    Idle,
    Loading,
    Active,
    Ended
  };

  const char *phaseName(Phase p) noexcept;

  struct Puzzle
  {
    SampledPly source;
    Snapshot scored;
    Snapshot preview;
    std::vector<std::string> previewMoves;
    core::Color mover = core::Color::White; // side to move at the scored position
  };

  struct QuizSessionState
  {
    int score = 0;
    double timeRemaining = 0.0; // +inf when the timer is hidden
    std::vector<QuestionType> activeQuestionTypes; // display order
    std::map<QuestionType, AnswerRecord> answers;
    std::map<QuestionType, bool> correctness;
    std::optional<Puzzle> puzzle;
    int plyAhead = 0;
    bool ended = false;
    Phase phase = Phase::Idle;
  };

  struct QuestionFeedback
  {
    QuestionType type;
    bool correct = false;
  };

  struct SubmitResult
  {
    bool accepted = false; // false when the session was not Active
    std::vector<QuestionFeedback> feedback;
    int scoreGained = 0;
    bool advanced = false; // a new puzzle was loaded
    bool ended = false;
  };

  class QuizSession
  {
  public:
    QuizSession(const corpus::PositionCorpus &corpus, TickScheduler &scheduler,
                QuizConfig config = {}, std::unique_ptr<RandomSource> rng = nullptr);
    ~QuizSession();

    QuizSession(const QuizSession &) = delete;
    QuizSession &operator=(const QuizSession &) = delete;

    // New session: score 0, fresh puzzle, full time budget, one live timer.
    // Rethrows EmptyPartition / ReplayError after latching Ended.
    void start();

    // One elapsed time unit. No-op unless Active.
    void tick();

    // Counts per question; a missing entry or std::nullopt counts as a wrong answer.
    SubmitResult submit(const std::map<QuestionType, std::optional<int>> &counts);

    // Ends the session, keeping the score and exposing every answer.
    void reveal();

    // Cancels the timer without touching the session state.
    void stopTimer() noexcept { m_timer.cancel(); }

    // Replaces the configuration and starts a new session.
    void applyConfig(QuizConfig config);

    // Answer for an absolute colour; computed and cached when not already known.
    const AnswerRecord &answerFor(core::Color color, Kind kind);

    const QuizSessionState &state() const noexcept { return m_state; }
    const QuizConfig &config() const noexcept { return m_config; }
    Phase phase() const noexcept { return m_state.phase; }

    // Side to move on the board shown to the user (the preview position).
    core::Color playerToMove() const noexcept { return m_playerToMove; }
    // Side to move at the scored position.
    core::Color playerToMoveAfter() const noexcept { return m_playerToMoveAfter; }

    const std::vector<QuestionType> &activeInDisplayOrder() const noexcept
    {
      return m_state.activeQuestionTypes;
    }
    const std::string &lastError() const noexcept { return m_lastError; }
    bool timerActive() const noexcept { return m_timer.active(); }

  private:
    const corpus::PositionCorpus &m_corpus;
    TickScheduler &m_scheduler;
    QuizConfig m_config;
    std::unique_ptr<RandomSource> m_rng;
    PositionSampler m_sampler;
    GameReconstructor m_reconstructor;
    AnswerEngine m_engine;

    QuizSessionState m_state;
    TickHandle m_timer;
    core::Color m_playerToMove = core::Color::White;
    core::Color m_playerToMoveAfter = core::Color::White;
    bool m_loading = false;
    std::string m_lastError;

    void resolveSides();
    void loadPuzzle();
    void penalize();
    void end(const char *reason);
  };
} // namespace movecount::quiz
