#pragma once

#include <array>
#include <optional>
#include <ostream>
#include <string>

#include "board_renderer.hpp"

namespace movecount::app {

// 8x8 text diagram. Highlighted squares show the letter of the piece kind that reaches them
// (upper-case when it gets there by two or more moves, '*' when several kinds do).
class TextBoardRenderer : public BoardRenderer {
 public:
  explicit TextBoardRenderer(std::ostream& out) : m_out(out) {}

  void show(const std::string& fen) override;
  void setFlipped(bool flipped) override { m_flipped = flipped; }
  void showHighlights(const quiz::HighlightMap& map, core::Color side) override;
  void clearHighlights() override;

  // Diagram for the last shown position with the current overlay.
  std::string render() const;

  static char highlightMarker(const quiz::SquareHighlight& h);

 private:
  std::ostream& m_out;
  bool m_flipped = false;
  std::array<char, 64> m_squares{};
  std::array<char, 64> m_overlay{};
  bool m_hasPosition = false;
};

}  // namespace movecount::app
