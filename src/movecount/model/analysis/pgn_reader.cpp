#include "movecount/model/analysis/pgn_reader.hpp"

#include <cctype>
#include <string>
#include <vector>

#include "movecount/model/chess_game.hpp"
#include "movecount/model/analysis/san_notation.hpp"

namespace movecount::model::analysis
{
  namespace
  {
    inline bool isSpace(char c) { return std::isspace((unsigned char)c) != 0; }
    inline bool isDigit(char c) { return c >= '0' && c <= '9'; }

    bool isResultToken(std::string_view t)
    {
      return (t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*");
    }

    // Reads the [Key "Value"] section and returns the offset where movetext begins.
    std::size_t parseTags(std::string_view pgn, GameRecord &out)
    {
      std::size_t i = 0;
      for (;;)
      {
        while (i < pgn.size() && isSpace(pgn[i]))
          ++i;
        if (i >= pgn.size() || pgn[i] != '[')
          return i;

        const std::size_t end = pgn.find(']', i);
        if (end == std::string_view::npos)
          return pgn.size();

        const std::string_view body = pgn.substr(i + 1, end - i - 1);
        const std::size_t sp = body.find(' ');
        const std::size_t q1 = body.find('"');
        const std::size_t q2 = body.rfind('"');
        if (sp != std::string_view::npos && q1 != std::string_view::npos && q2 > q1)
          out.tags[std::string(body.substr(0, sp))] = std::string(body.substr(q1 + 1, q2 - q1 - 1));

        i = end + 1;
      }
    }

    // Movetext lexer: skips comments ({...} and ';' to end of line), nested variations,
    // NAGs ($n) and move numbers ("12." / "12..."), yielding SAN and result tokens only.
    class MovetextLexer
    {
    public:
      explicit MovetextLexer(std::string_view text) : m_text(text) {}

      bool next(std::string &tok)
      {
        tok.clear();
        while (m_pos < m_text.size())
        {
          const char c = m_text[m_pos];
          if (isSpace(c) || c == ')')
          {
            ++m_pos;
          }
          else if (c == '{')
          {
            const std::size_t end = m_text.find('}', m_pos);
            m_pos = (end == std::string_view::npos) ? m_text.size() : end + 1;
          }
          else if (c == ';')
          {
            const std::size_t end = m_text.find('\n', m_pos);
            m_pos = (end == std::string_view::npos) ? m_text.size() : end + 1;
          }
          else if (c == '(')
          {
            skipVariation();
          }
          else if (c == '$')
          {
            ++m_pos;
            while (m_pos < m_text.size() && isDigit(m_text[m_pos]))
              ++m_pos;
          }
          else
          {
            readWord(tok);
            if (!tok.empty())
              return true;
          }
        }
        return false;
      }

    private:
      std::string_view m_text;
      std::size_t m_pos = 0;

      void skipVariation()
      {
        int depth = 0;
        while (m_pos < m_text.size())
        {
          const char c = m_text[m_pos++];
          if (c == '{')
          {
            const std::size_t end = m_text.find('}', m_pos);
            m_pos = (end == std::string_view::npos) ? m_text.size() : end + 1;
          }
          else if (c == '(')
            ++depth;
          else if (c == ')' && --depth == 0)
            return;
        }
      }

      // One whitespace-delimited word with a leading move number ("1.e4", "10...O-O") removed.
      void readWord(std::string &tok)
      {
        const std::size_t start = m_pos;
        while (m_pos < m_text.size() && !isSpace(m_text[m_pos]) && m_text[m_pos] != '{' &&
               m_text[m_pos] != '(' && m_text[m_pos] != ')' && m_text[m_pos] != ';' &&
               m_text[m_pos] != '$')
          ++m_pos;
        std::string_view word = m_text.substr(start, m_pos - start);

        std::size_t digits = 0;
        while (digits < word.size() && isDigit(word[digits]))
          ++digits;
        std::size_t dots = digits;
        while (dots < word.size() && word[dots] == '.')
          ++dots;
        if (digits > 0 && dots > digits)
          word.remove_prefix(dots);
        if (word.find_first_not_of('.') == std::string_view::npos)
          word = {};

        tok.assign(word);
      }
    };
  } // namespace

  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err)
  {
    out = GameRecord{};
    const std::size_t movetextStart = parseTags(pgn, out);

    // start FEN
    auto itFen = out.tags.find("FEN");
    if (itFen != out.tags.end() && !itFen->second.empty())
      out.startFen = itFen->second;

    if (out.startFen.empty())
      out.startFen = core::START_FEN;

    model::ChessGame g;
    std::string fenErr;
    if (!g.setPosition(out.startFen, &fenErr))
    {
      if (err)
        *err = "Bad FEN tag: " + fenErr;
      return false;
    }

    MovetextLexer lexer(pgn.substr(movetextStart));
    std::string t;
    while (lexer.next(t))
    {
      if (isResultToken(t))
      {
        out.result = t;
        break;
      }

      model::Move mv;
      if (!model::notation::fromSan(g.getPosition(), t, mv))
      {
        if (err)
          *err = "Could not parse SAN token: " + t;
        return false;
      }

      // Apply to validate legality and advance.
      if (!g.doMove(mv))
      {
        if (err)
          *err = "Illegal move in PGN: " + t;
        return false;
      }

      out.plies.push_back(mv);
    }

    auto itRes = out.tags.find("Result");
    if (out.result == "*" && itRes != out.tags.end() && isResultToken(itRes->second))
      out.result = itRes->second;

    return true;
  }
} // namespace movecount::model::analysis
