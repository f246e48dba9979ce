#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace movecount::corpus
{
  // Splits a multi-game PGN file into one transcript per game. Sections are separated by
  // blank lines; a section starting with '[' opens a new game and any other section
  // (movetext) is appended to the current one.
  std::vector<std::string> splitGames(std::string_view text);
} // namespace movecount::corpus
