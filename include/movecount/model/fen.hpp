#pragma once

#include <string>

#include "position.hpp"

namespace movecount::model {

// Parses a six-field FEN (the two clock fields may be omitted). On failure 'out' is left
// unspecified and 'err' (if given) describes the problem.
bool parseFen(const std::string& fen, Position& out, std::string* err = nullptr);

std::string toFen(const Position& pos);

// Same FEN with only the side-to-move field replaced. Castling and en passant fields are
// kept as they are.
std::string withSideToMove(const std::string& fen, core::Color side);

}  // namespace movecount::model
