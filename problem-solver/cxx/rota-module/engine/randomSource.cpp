#include "randomSource.hpp"

MersenneRandomSource::MersenneRandomSource()
  : m_generator(std::random_device{}())
{
}

MersenneRandomSource::MersenneRandomSource(uint32_t seed)
  : m_generator(seed)
{
}

size_t MersenneRandomSource::PickIndex(size_t count)
{
  if (count <= 1)
    return 0;

  std::uniform_int_distribution<size_t> distribution(0, count - 1);
  return distribution(m_generator);
}
