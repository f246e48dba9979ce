#pragma once

#include <string>

#include "movecount/quiz/highlight_map.hpp"

namespace movecount::app {

class BoardRenderer {
 public:
  virtual ~BoardRenderer() = default;

  virtual void show(const std::string& fen) = 0;
  // Black at the bottom when flipped.
  virtual void setFlipped(bool flipped) = 0;
  virtual void showHighlights(const quiz::HighlightMap& map, core::Color side) = 0;
  virtual void clearHighlights() = 0;
};

}  // namespace movecount::app
