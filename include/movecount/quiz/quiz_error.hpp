#pragma once

#include <stdexcept>
#include <string>

namespace movecount::quiz
{
  class QuizError : public std::runtime_error
  {
  public:
    explicit QuizError(const std::string &what) : std::runtime_error(what) {}
  };

  // No weight entry matches the requested side-to-move parity.
  class EmptyPartition : public QuizError
  {
  public:
    explicit EmptyPartition(const std::string &what) : QuizError(what) {}
  };

  // A transcript does not parse or a recorded move cannot be applied.
  class ReplayError : public QuizError
  {
  public:
    explicit ReplayError(const std::string &what) : QuizError(what) {}
  };

  class InvalidQuestionType : public QuizError
  {
  public:
    explicit InvalidQuestionType(const std::string &what) : QuizError(what) {}
  };
} // namespace movecount::quiz
