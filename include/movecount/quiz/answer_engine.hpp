#pragma once

#include <map>
#include <string>
#include <vector>

#include "game_reconstructor.hpp"
#include "movecount/model/move.hpp"
#include "question_type.hpp"

namespace movecount::quiz
{
  struct Target
  {
    core::Square square = core::NO_SQUARE;
    core::PieceType piece = core::PieceType::None;

    friend bool operator==(const Target &, const Target &) = default;
  };

  struct AnswerRecord
  {
    int count = 0;
    std::vector<std::string> moves; // SAN, enumeration order
    std::vector<Target> targets;    // not deduplicated
  };

  // One legal move with everything the classifiers look at.
  struct MoveDetail
  {
    model::Move move;
    core::PieceType piece = core::PieceType::None;
    std::string san;
    core::Square to = core::NO_SQUARE;
    bool capture = false;
    bool enPassant = false;
  };

  class AnswerEngine
  {
  public:
    // Throws InvalidQuestionType for tags outside the enumeration.
    AnswerRecord answer(const Snapshot &snap, QuestionType qt) const;
    AnswerRecord answerFen(const std::string &fen, QuestionType qt) const;
    AnswerRecord answer(const model::Position &pos, QuestionType qt) const;

    std::map<QuestionType, AnswerRecord> answerAll(const Snapshot &snap,
                                                   const std::vector<QuestionType> &types) const;

    // Legal moves of the side to move in 'pos', with detail.
    static std::vector<MoveDetail> enumerate(const model::Position &pos);

    // Side to move replaced, everything else kept (castling rights, en passant square, clocks).
    static model::Position flipped(const model::Position &pos);
  };
} // namespace movecount::quiz
