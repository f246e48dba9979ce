#pragma once
#include <string>
#include <string_view>

#include "movecount/model/analysis/game_record.hpp"

namespace movecount::model::analysis
{
  // Parses one game (tag section + movetext). Every move is validated by replaying it.
  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err = nullptr);
}
