#include "movecount/quiz/random_source.hpp"

namespace movecount::quiz
{
  DefaultRandomSource::DefaultRandomSource(std::optional<std::uint64_t> seed)
  {
    if (seed)
    {
      m_rng.seed(*seed);
    }
    else
    {
      std::random_device rd;
      m_rng.seed((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    }
  }

  double DefaultRandomSource::uniform()
  {
    const double u = m_dist(m_rng);
    // some standard libraries can return the upper bound
    return u < 1.0 ? u : 0.0;
  }
} // namespace movecount::quiz
