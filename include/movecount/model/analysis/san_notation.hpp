#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "movecount/model/move.hpp"
#include "movecount/model/position.hpp"

namespace movecount::model::notation
{

  // Empty string if 'mv' is not legal in 'pos'.
  std::string toSan(const model::Position &pos, const model::Move &mv);

  // Same, with the legal move list of 'pos' already at hand (used for disambiguation).
  std::string toSan(const model::Position &pos, const model::Move &mv,
                    const std::vector<model::Move> &legals);

  // Finds the move corresponding to a SAN token in the given position.
  // Accepts annotations (!, ?, +, #), "0-0" style castling and UCI-like tokens ("e2e4", "e7e8q").
  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out);

} // namespace movecount::model::notation
