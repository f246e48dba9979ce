#pragma once

#include <stdexcept>
#include <string>

namespace movecount::corpus
{
  // Unreadable or unusable corpus data. Fatal at startup.
  class CorpusError : public std::runtime_error
  {
  public:
    explicit CorpusError(const std::string &what) : std::runtime_error(what) {}
  };
} // namespace movecount::corpus
