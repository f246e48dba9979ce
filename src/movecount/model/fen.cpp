#include "movecount/model/fen.hpp"

#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

namespace movecount::model {

namespace {

inline char tolower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
}

inline core::PieceType pieceFromChar(char lo) noexcept {
  switch (lo) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return core::PieceType::None;
  }
}

std::vector<std::string_view> splitFields(std::string_view sv) {
  std::vector<std::string_view> fields;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    if (i >= sv.size()) break;
    std::size_t j = i;
    while (j < sv.size() && !std::isspace(static_cast<unsigned char>(sv[j]))) ++j;
    fields.push_back(sv.substr(i, j - i));
    i = j;
  }
  return fields;
}

bool parseCounter(std::string_view sv, int& out) {
  if (sv.empty() || sv.size() > 6) return false;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + (c - '0');
  }
  out = val;
  return true;
}

inline bool fail(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

}  // namespace

bool parseFen(const std::string& fen, Position& out, std::string* err) {
  const auto fields = splitFields(fen);
  if (fields.size() != 4 && fields.size() != 6)
    return fail(err, "FEN must have 4 or 6 fields: '" + fen + "'");

  out = Position{};
  Board& board = out.getBoard();
  GameState& st = out.getState();

  // Board placement
  int rank = 7, file = 0;
  for (char ch : fields[0]) {
    if (ch == '/') {
      if (file != 8) return fail(err, "FEN rank does not have 8 files");
      if (rank == 0) return fail(err, "FEN has more than 8 ranks");
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return fail(err, "FEN rank overflows");
      continue;
    }
    const char lo = tolower_ascii(ch);
    const core::PieceType type = pieceFromChar(lo);
    if (type == core::PieceType::None) return fail(err, std::string("bad FEN piece '") + ch + "'");
    if (file > 7) return fail(err, "FEN rank overflows");
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    board.setPiece(static_cast<core::Square>(file + rank * 8), {type, col});
    ++file;
  }
  if (rank != 0 || file != 8) return fail(err, "FEN board must have 8 ranks of 8 files");

  for (core::Color c : {core::Color::White, core::Color::Black}) {
    if (bb::popcount(board.getPieces(c, core::PieceType::King)) != 1)
      return fail(err, std::string(core::colorName(c)) + " must have exactly one king");
  }
  if ((board.getPieces(core::Color::White, core::PieceType::Pawn) |
       board.getPieces(core::Color::Black, core::PieceType::Pawn)) &
      (bb::RANK_1 | bb::RANK_8))
    return fail(err, "pawn on first or last rank");

  // Active color
  if (fields[1] == "w")
    st.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    st.sideToMove = core::Color::Black;
  else
    return fail(err, "bad side to move '" + std::string(fields[1]) + "'");

  // Castling rights
  std::uint8_t rights = 0;
  if (fields[2] != "-") {
    for (char c : fields[2]) {
      switch (c) {
        case 'K':
          rights |= bb::Castling::WK;
          break;
        case 'Q':
          rights |= bb::Castling::WQ;
          break;
        case 'k':
          rights |= bb::Castling::BK;
          break;
        case 'q':
          rights |= bb::Castling::BQ;
          break;
        default:
          return fail(err, "bad castling field '" + std::string(fields[2]) + "'");
      }
    }
  }
  st.castlingRights = rights;

  // En passant
  const std::string_view ep = fields[3];
  if (ep == "-") {
    st.enPassantSquare = core::NO_SQUARE;
  } else if (ep.size() == 2 && ep[0] >= 'a' && ep[0] <= 'h' && (ep[1] == '3' || ep[1] == '6')) {
    st.enPassantSquare = static_cast<core::Square>((ep[0] - 'a') + (ep[1] - '1') * 8);
  } else {
    return fail(err, "bad en passant field '" + std::string(ep) + "'");
  }

  // Clocks
  int hm = 0, fm = 1;
  if (fields.size() == 6) {
    if (!parseCounter(fields[4], hm) || !parseCounter(fields[5], fm))
      return fail(err, "bad move counters in FEN");
    if (fm == 0) fm = 1;
  }
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.fullmoveNumber = static_cast<std::uint32_t>(fm);
  return true;
}

std::string toFen(const Position& pos) {
  std::ostringstream fen;
  const Board& board = pos.getBoard();
  const GameState& st = pos.getState();

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto p = board.getPiece(static_cast<core::Square>(rank * 8 + file));
      if (!p) {
        ++empty;
        continue;
      }
      if (empty) {
        fen << empty;
        empty = 0;
      }
      const char c = core::pieceChar(p->type);
      fen << (p->color == core::Color::White ? static_cast<char>(std::toupper(c)) : c);
    }
    if (empty) fen << empty;
    if (rank > 0) fen << '/';
  }

  fen << ' ' << (st.sideToMove == core::Color::White ? 'w' : 'b') << ' ';

  std::string castling;
  if (st.castlingRights & bb::Castling::WK) castling += 'K';
  if (st.castlingRights & bb::Castling::WQ) castling += 'Q';
  if (st.castlingRights & bb::Castling::BK) castling += 'k';
  if (st.castlingRights & bb::Castling::BQ) castling += 'q';
  fen << (castling.empty() ? "-" : castling) << ' ';

  fen << core::squareName(st.enPassantSquare) << ' ' << st.halfmoveClock << ' '
      << st.fullmoveNumber;
  return fen.str();
}

std::string withSideToMove(const std::string& fen, core::Color side) {
  const std::size_t sp = fen.find(' ');
  if (sp == std::string::npos) return fen;
  const std::size_t end = fen.find(' ', sp + 1);
  std::string out = fen.substr(0, sp + 1);
  out += (side == core::Color::White ? 'w' : 'b');
  if (end != std::string::npos) out += fen.substr(end);
  return out;
}

}  // namespace movecount::model
