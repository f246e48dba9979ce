#include "movecount/corpus/pgn_splitter.hpp"

#include <cctype>
#include <iostream>

namespace movecount::corpus
{
  namespace
  {
    bool isBlank(std::string_view line)
    {
      for (char c : line)
        if (!std::isspace(static_cast<unsigned char>(c)))
          return false;
      return true;
    }

    std::string_view trimView(std::string_view v)
    {
      while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front())))
        v.remove_prefix(1);
      while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back())))
        v.remove_suffix(1);
      return v;
    }
  } // namespace

  std::vector<std::string> splitGames(std::string_view text)
  {
    // CRLF -> LF
    std::string normalized;
    normalized.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
      if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
        continue;
      normalized.push_back(text[i]);
    }

    // Sections separated by one or more blank lines
    std::vector<std::string> sections;
    std::string current;
    std::size_t pos = 0;
    while (pos <= normalized.size())
    {
      std::size_t nl = normalized.find('\n', pos);
      if (nl == std::string::npos)
        nl = normalized.size();
      const std::string_view line(normalized.data() + pos, nl - pos);
      if (isBlank(line))
      {
        if (!current.empty())
          sections.push_back(std::move(current));
        current.clear();
      }
      else
      {
        if (!current.empty())
          current.push_back('\n');
        current.append(line);
      }
      pos = nl + 1;
    }
    if (!current.empty())
      sections.push_back(std::move(current));

    std::vector<std::string> games;
    std::string game;
    for (const auto &section : sections)
    {
      const std::string_view s = trimView(section);
      if (s.empty())
        continue;
      if (s.front() == '[')
      {
        if (!game.empty())
          games.push_back(std::move(game));
        game.assign(s);
      }
      else if (game.empty())
      {
        game.assign(s);
      }
      else
      {
        game += "\n\n";
        game.append(s);
      }
    }
    if (!game.empty())
      games.push_back(std::move(game));

    std::cerr << "[Corpus] found " << games.size() << " games\n";
    return games;
  }
} // namespace movecount::corpus
