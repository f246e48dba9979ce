#include "movecount/app/text_board_renderer.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

#include "movecount/model/fen.hpp"

namespace movecount::app {

void TextBoardRenderer::show(const std::string& fen) {
  model::Position pos;
  std::string err;
  if (!model::parseFen(fen, pos, &err)) {
    std::cerr << "[Renderer] cannot show FEN '" << fen << "': " << err << "\n";
    return;
  }

  const model::Board& board = pos.getBoard();
  for (int sq = 0; sq < 64; ++sq) {
    const auto p = board.getPiece(static_cast<core::Square>(sq));
    if (!p) {
      m_squares[sq] = '.';
      continue;
    }
    const char c = core::pieceChar(p->type);
    m_squares[sq] = (p->color == core::Color::White) ? static_cast<char>(std::toupper(c)) : c;
  }
  m_overlay.fill(0);
  m_hasPosition = true;
  m_out << render();
}

char TextBoardRenderer::highlightMarker(const quiz::SquareHighlight& h) {
  if (h.pieces.empty()) return 0;
  if (!h.singleKind()) return '*';
  const char c = core::pieceChar(h.pieces.begin()->first);
  return h.duplicated() ? static_cast<char>(std::toupper(c)) : c;
}

void TextBoardRenderer::showHighlights(const quiz::HighlightMap& map, core::Color side) {
  m_overlay.fill(0);
  for (const auto& [sq, h] : map) m_overlay[sq] = highlightMarker(h);

  m_out << render();
  m_out << core::colorName(side) << " pieces reaching each square:";
  if (map.empty()) m_out << " none";
  m_out << "\n";
  for (const auto& [sq, h] : map) {
    m_out << "  " << core::squareName(sq) << ":";
    for (const auto& [piece, n] : h.pieces) {
      m_out << ' ' << static_cast<char>(std::toupper(core::pieceChar(piece)));
      if (n > 1) m_out << "x" << n;
    }
    m_out << "\n";
  }
}

void TextBoardRenderer::clearHighlights() {
  m_overlay.fill(0);
}

std::string TextBoardRenderer::render() const {
  std::ostringstream os;
  if (!m_hasPosition) return "";

  const std::string files = m_flipped ? "h g f e d c b a" : "a b c d e f g h";
  os << "\n     " << files << "\n";
  for (int row = 0; row < 8; ++row) {
    const int rank = m_flipped ? row : 7 - row;
    os << "  " << (rank + 1) << ' ';
    for (int col = 0; col < 8; ++col) {
      const int file = m_flipped ? 7 - col : col;
      const int sq = rank * 8 + file;
      if (m_overlay[sq]) {
        os << '[' << m_overlay[sq];
      } else {
        os << ' ' << m_squares[sq];
      }
    }
    os << "  " << (rank + 1) << "\n";
  }
  os << "     " << files << "\n\n";
  return os.str();
}

}  // namespace movecount::app
