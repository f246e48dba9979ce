#include "movecount/quiz/answer_engine.hpp"

#include "movecount/model/analysis/san_notation.hpp"
#include "movecount/model/chess_game.hpp"
#include "movecount/model/fen.hpp"
#include "movecount/quiz/quiz_error.hpp"

namespace movecount::quiz
{
  namespace
  {
    // Mover's opponent is in check after the trial move.
    bool givesCheck(const model::Position &pos, const model::Move &mv)
    {
      model::Position trial = pos;
      if (!trial.doMove(mv))
        return false;
      return trial.inCheck();
    }

    bool selected(const model::Position &pos, const MoveDetail &d, Kind kind)
    {
      switch (kind)
      {
      case Kind::AllLegal:
        return true;
      case Kind::Captures:
        return d.capture || d.enPassant;
      case Kind::Checks:
        return givesCheck(pos, d.move);
      }
      return false;
    }
  } // namespace

  model::Position AnswerEngine::flipped(const model::Position &pos)
  {
    model::Position out;
    out.getBoard() = pos.getBoard();
    out.getState() = pos.getState();
    out.getState().sideToMove = ~pos.getState().sideToMove;
    return out;
  }

  std::vector<MoveDetail> AnswerEngine::enumerate(const model::Position &pos)
  {
    model::ChessGame g;
    g.setPosition(pos);
    const std::vector<model::Move> legals = g.generateLegalMoves();

    std::vector<MoveDetail> out;
    out.reserve(legals.size());
    for (const auto &m : legals)
    {
      MoveDetail d;
      d.move = m;
      const auto pc = pos.getBoard().getPiece(m.from());
      d.piece = pc ? pc->type : core::PieceType::None;
      d.san = model::notation::toSan(pos, m, legals);
      d.to = m.to();
      d.capture = m.isCapture();
      d.enPassant = m.isEnPassant();
      out.push_back(std::move(d));
    }
    return out;
  }

  AnswerRecord AnswerEngine::answer(const model::Position &pos, QuestionType qt) const
  {
    if (!qt.isValid())
      throw InvalidQuestionType("question type tags out of range (perspective " +
                                std::to_string(static_cast<int>(qt.perspective)) + ", kind " +
                                std::to_string(static_cast<int>(qt.kind)) + ")");

    const model::Position eval = (qt.perspective == Perspective::Mover) ? pos : flipped(pos);

    AnswerRecord rec;
    for (const auto &d : enumerate(eval))
    {
      if (!selected(eval, d, qt.kind))
        continue;
      rec.moves.push_back(d.san);
      rec.targets.push_back(Target{d.to, d.piece});
    }
    rec.count = static_cast<int>(rec.moves.size());
    return rec;
  }

  AnswerRecord AnswerEngine::answer(const Snapshot &snap, QuestionType qt) const
  {
    return answer(snap.position, qt);
  }

  AnswerRecord AnswerEngine::answerFen(const std::string &fen, QuestionType qt) const
  {
    model::Position pos;
    std::string err;
    if (!model::parseFen(fen, pos, &err))
      throw std::invalid_argument("bad FEN: " + err);
    return answer(pos, qt);
  }

  std::map<QuestionType, AnswerRecord> AnswerEngine::answerAll(
      const Snapshot &snap, const std::vector<QuestionType> &types) const
  {
    std::map<QuestionType, AnswerRecord> out;
    for (const auto &qt : types)
    {
      if (out.find(qt) == out.end())
        out.emplace(qt, answer(snap, qt));
    }
    return out;
  }
} // namespace movecount::quiz
