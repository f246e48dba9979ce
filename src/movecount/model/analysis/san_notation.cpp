#include "movecount/model/analysis/san_notation.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "movecount/model/chess_game.hpp"

namespace movecount::model::notation
{
  namespace
  {
    int fileOf(core::Square sq) { return int(sq) & 7; }
    int rankOf(core::Square sq) { return int(sq) >> 3; }

    // 'N', 'B', 'R', 'Q', 'K'; pawns have no letter.
    char sanLetter(core::PieceType pt)
    {
      if (pt == core::PieceType::Pawn || pt == core::PieceType::None)
        return '\0';
      return char(std::toupper((unsigned char)core::pieceChar(pt)));
    }

    // Case-insensitive piece letter. Pawns are not named in SAN and map to None.
    core::PieceType letterPiece(char c)
    {
      switch (std::tolower((unsigned char)c))
      {
      case 'n':
        return core::PieceType::Knight;
      case 'b':
        return core::PieceType::Bishop;
      case 'r':
        return core::PieceType::Rook;
      case 'q':
        return core::PieceType::Queen;
      case 'k':
        return core::PieceType::King;
      default:
        return core::PieceType::None;
      }
    }

    std::optional<core::Square> squareAt(std::string_view s, std::size_t i)
    {
      if (i + 2 > s.size())
        return std::nullopt;
      const char f = s[i], r = s[i + 1];
      if (f < 'a' || f > 'h' || r < '1' || r > '8')
        return std::nullopt;
      return static_cast<core::Square>((f - 'a') + (r - '1') * 8);
    }

    // Strips whitespace, annotation glyphs and check marks; maps zero-castling to letter O.
    std::string cleanToken(std::string_view in)
    {
      while (!in.empty() && std::isspace((unsigned char)in.front()))
        in.remove_prefix(1);
      while (!in.empty())
      {
        const char c = in.back();
        if (std::isspace((unsigned char)c) || c == '+' || c == '#' || c == '!' || c == '?')
          in.remove_suffix(1);
        else
          break;
      }
      std::string s(in);
      if (s == "0-0" || s == "0-0-0")
        std::replace(s.begin(), s.end(), '0', 'O');
      return s;
    }

    bool isResultToken(std::string_view t)
    {
      return t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*";
    }

    // "e2e4" / "e7e8q"
    std::optional<Move> matchCoordinate(std::string_view tok, const std::vector<Move> &legals)
    {
      if (tok.size() != 4 && tok.size() != 5)
        return std::nullopt;
      const auto from = squareAt(tok, 0);
      const auto to = squareAt(tok, 2);
      if (!from || !to)
        return std::nullopt;
      core::PieceType promo = core::PieceType::None;
      if (tok.size() == 5)
      {
        promo = letterPiece(tok[4]);
        if (promo == core::PieceType::None || promo == core::PieceType::King)
          return std::nullopt;
      }
      for (const auto &m : legals)
        if (m.from() == *from && m.to() == *to && m.promotion() == promo)
          return m;
      return std::nullopt;
    }

    // [piece][file][rank][x]square[=promo]
    struct SanPattern
    {
      core::PieceType piece = core::PieceType::Pawn;
      int file = -1;
      int rank = -1;
      core::Square to = core::NO_SQUARE;
      core::PieceType promo = core::PieceType::None;

      bool accepts(const Board &board, const Move &m) const
      {
        if (m.to() != to || m.promotion() != promo)
          return false;
        const auto pc = board.getPiece(m.from());
        if (!pc || pc->type != piece)
          return false;
        return (file < 0 || fileOf(m.from()) == file) && (rank < 0 || rankOf(m.from()) == rank);
      }
    };

    std::optional<SanPattern> readPattern(std::string_view s)
    {
      SanPattern p;
      if (!s.empty() && std::isupper((unsigned char)s.front()))
      {
        p.piece = letterPiece(s.front());
        if (p.piece == core::PieceType::None)
          return std::nullopt;
        s.remove_prefix(1);
      }

      if (s.size() >= 3 && std::isupper((unsigned char)s.back()))
      {
        p.promo = letterPiece(s.back());
        if (p.promo == core::PieceType::None || p.promo == core::PieceType::King)
          return std::nullopt;
        s.remove_suffix(1);
        if (!s.empty() && s.back() == '=')
          s.remove_suffix(1);
      }

      if (s.size() < 2)
        return std::nullopt;
      const auto to = squareAt(s, s.size() - 2);
      if (!to)
        return std::nullopt;
      p.to = *to;

      for (const char c : s.substr(0, s.size() - 2))
      {
        if (c == 'x' || c == ':' || c == '-')
          continue;
        if (c >= 'a' && c <= 'h')
          p.file = c - 'a';
        else if (c >= '1' && c <= '8')
          p.rank = c - '1';
        else
          return std::nullopt;
      }
      return p;
    }

    // File, rank or both, whichever singles the move out among same-kind pieces.
    std::string disambiguation(const Board &board, const Move &mv, core::PieceType pt,
                               const std::vector<Move> &legals)
    {
      bool rival = false, fileClash = false, rankClash = false;
      for (const auto &m : legals)
      {
        if (m.to() != mv.to() || m.from() == mv.from())
          continue;
        const auto pc = board.getPiece(m.from());
        if (!pc || pc->type != pt)
          continue;
        rival = true;
        fileClash |= fileOf(m.from()) == fileOf(mv.from());
        rankClash |= rankOf(m.from()) == rankOf(mv.from());
      }
      if (!rival)
        return "";
      const std::string from = core::squareName(mv.from());
      if (!fileClash)
        return from.substr(0, 1);
      if (!rankClash)
        return from.substr(1, 1);
      return from;
    }

    std::string checkSuffix(const Position &pos, const Move &mv)
    {
      ChessGame after;
      after.setPosition(pos);
      if (!after.doMove(mv) || !after.isKingInCheck(after.getGameState().sideToMove))
        return "";
      return after.generateLegalMoves().empty() ? "#" : "+";
    }
  } // namespace

  std::string toSan(const Position &pos, const Move &mv)
  {
    ChessGame g;
    g.setPosition(pos);
    return toSan(pos, mv, g.generateLegalMoves());
  }

  std::string toSan(const Position &pos, const Move &mv, const std::vector<Move> &legals)
  {
    if (std::find(legals.begin(), legals.end(), mv) == legals.end())
      return "";

    if (mv.isCastle())
      return (mv.castle() == CastleSide::KingSide ? "O-O" : "O-O-O") + checkSuffix(pos, mv);

    const Board &board = pos.getBoard();
    const auto piece = board.getPiece(mv.from());
    if (!piece)
      return "";

    std::string san;
    if (piece->type == core::PieceType::Pawn)
    {
      if (mv.isCapture() || mv.isEnPassant())
        san += core::squareName(mv.from()).front();
    }
    else
    {
      san += sanLetter(piece->type);
      san += disambiguation(board, mv, piece->type, legals);
    }
    if (mv.isCapture() || mv.isEnPassant())
      san += 'x';
    san += core::squareName(mv.to());
    if (mv.promotion() != core::PieceType::None)
    {
      san += '=';
      san += sanLetter(mv.promotion());
    }
    return san + checkSuffix(pos, mv);
  }

  bool fromSan(const Position &pos, std::string_view sanToken, Move &out)
  {
    const std::string tok = cleanToken(sanToken);
    if (tok.empty() || isResultToken(tok))
      return false;

    ChessGame g;
    g.setPosition(pos);
    const auto &legals = g.generateLegalMoves();

    if (tok == "O-O" || tok == "O-O-O")
    {
      const CastleSide side = (tok == "O-O") ? CastleSide::KingSide : CastleSide::QueenSide;
      const auto it = std::find_if(legals.begin(), legals.end(),
                                   [&](const Move &m)
                                   { return m.isCastle() && m.castle() == side; });
      if (it == legals.end())
        return false;
      out = *it;
      return true;
    }

    if (const auto m = matchCoordinate(tok, legals))
    {
      out = *m;
      return true;
    }

    const auto pattern = readPattern(tok);
    if (!pattern)
      return false;

    const Board &board = pos.getBoard();
    std::optional<Move> found;
    for (const auto &m : legals)
    {
      if (!pattern->accepts(board, m))
        continue;
      if (found)
        return false; // ambiguous
      found = m;
    }
    if (!found)
      return false;
    out = *found;
    return true;
  }

} // namespace movecount::model::notation
