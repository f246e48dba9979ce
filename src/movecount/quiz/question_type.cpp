#include "movecount/quiz/question_type.hpp"

#include <algorithm>
#include <cctype>

namespace movecount::quiz
{
  namespace
  {
    std::string lower(std::string_view s)
    {
      std::string out(s);
      for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      return out;
    }
  } // namespace

  std::vector<QuestionType> inDisplayOrder(const std::vector<QuestionType> &active, core::Color mover)
  {
    std::vector<QuestionType> out;
    for (const auto &slot : DISPLAY_ORDER)
    {
      const QuestionType qt = questionFor(slot.color, slot.kind, mover);
      if (std::find(active.begin(), active.end(), qt) != active.end())
        out.push_back(qt);
    }
    return out;
  }

  const char *kindName(Kind k) noexcept
  {
    switch (k)
    {
    case Kind::AllLegal:
      return "moves";
    case Kind::Checks:
      return "checks";
    case Kind::Captures:
      return "captures";
    }
    return "?";
  }

  std::string label(core::Color color, Kind k)
  {
    return std::string(core::colorName(color)) + "'s " + kindName(k);
  }

  std::string toString(QuestionType qt)
  {
    return std::string(qt.perspective == Perspective::Mover ? "mover-" : "opponent-") +
           kindName(qt.kind);
  }

  std::optional<Kind> parseKind(std::string_view text)
  {
    const std::string s = lower(text);
    if (s == "moves" || s == "all" || s == "legal")
      return Kind::AllLegal;
    if (s == "checks")
      return Kind::Checks;
    if (s == "captures")
      return Kind::Captures;
    return std::nullopt;
  }

  std::optional<QuestionType> parseQuestionType(std::string_view text)
  {
    const std::string s = lower(text);
    const std::size_t dash = s.find('-');
    if (dash == std::string::npos)
      return std::nullopt;

    QuestionType qt;
    const std::string who = s.substr(0, dash);
    if (who == "mover")
      qt.perspective = Perspective::Mover;
    else if (who == "opponent")
      qt.perspective = Perspective::Opponent;
    else
      return std::nullopt;

    const auto kind = parseKind(std::string_view(s).substr(dash + 1));
    if (!kind)
      return std::nullopt;
    qt.kind = *kind;
    return qt;
  }
} // namespace movecount::quiz
