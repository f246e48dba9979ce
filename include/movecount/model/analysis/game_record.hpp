#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "../move.hpp"

namespace movecount::model::analysis
{

  struct GameRecord
  {
    std::unordered_map<std::string, std::string> tags;
    std::string startFen;          // START_FEN unless a [FEN] tag is present
    std::vector<model::Move> plies; // ply order
    std::string result{"*"};       // "1-0", "0-1", "1/2-1/2", "*"
  };

} // namespace movecount::model::analysis
