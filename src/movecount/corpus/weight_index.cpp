#include "movecount/corpus/weight_index.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

#include "movecount/corpus/corpus_error.hpp"

namespace movecount::corpus
{
  namespace
  {
    long long json_to_integer(const nlohmann::json &value, const char *key, std::size_t row)
    {
      if (value.is_number_integer())
        return value.get<long long>();
      if (value.is_number_float())
      {
        const double d = value.get<double>();
        if (d == static_cast<double>(static_cast<long long>(d)))
          return static_cast<long long>(d);
      }
      throw CorpusError("weight row " + std::to_string(row) + ": expected integer for field '" +
                        key + "'");
    }

    double json_to_double(const nlohmann::json &value, const char *key, std::size_t row)
    {
      if (!value.is_number())
        throw CorpusError("weight row " + std::to_string(row) + ": expected number for field '" +
                          key + "'");
      return value.get<double>();
    }

    const nlohmann::json &field(const nlohmann::json &obj, const char *key, std::size_t row)
    {
      auto it = obj.find(key);
      if (it == obj.end())
        throw CorpusError("weight row " + std::to_string(row) + ": missing field '" + key + "'");
      return *it;
    }
  } // namespace

  std::vector<WeightEntry> loadWeightIndex(const std::string &jsonText)
  {
    nlohmann::json document;
    try
    {
      document = nlohmann::json::parse(jsonText);
    }
    catch (const nlohmann::json::parse_error &e)
    {
      throw CorpusError(std::string("weight index is not valid JSON: ") + e.what());
    }
    if (!document.is_array())
      throw CorpusError("weight index must be a JSON array");

    std::vector<WeightEntry> entries;
    entries.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i)
    {
      const nlohmann::json &row = document[i];
      if (!row.is_object())
        throw CorpusError("weight row " + std::to_string(i) + " is not an object");

      const long long game = json_to_integer(field(row, "game", i), "game", i);
      const long long ply = json_to_integer(field(row, "ply", i), "ply", i);
      const double weight = json_to_double(field(row, "weight", i), "weight", i);

      if (game < 0)
      {
        std::cerr << "[Corpus] skipping weight row " << i << ": negative game index " << game
                  << "\n";
        continue;
      }
      entries.push_back(WeightEntry{static_cast<std::size_t>(game), static_cast<int>(ply), weight});
    }

    std::cerr << "[Corpus] loaded " << entries.size() << " weight rows\n";
    return entries;
  }

  std::vector<WeightEntry> loadWeightIndexFile(const std::string &path)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw CorpusError("cannot open weight index '" + path + "'");
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return loadWeightIndex(text);
  }
} // namespace movecount::corpus
