#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

class RandomSource
{
public:
  virtual ~RandomSource() = default;

  // Равновероятно выбирает индекс из [0, count), count > 0
  virtual size_t PickIndex(size_t count) = 0;

  // Перемешивание Фишера-Йетса поверх PickIndex
  template <typename T>
  void Shuffle(std::vector<T> & items)
  {
    for (size_t i = items.size(); i > 1; --i)
    {
      size_t const j = PickIndex(i);
      std::swap(items[i - 1], items[j]);
    }
  }
};

class MersenneRandomSource : public RandomSource
{
public:
  MersenneRandomSource();
  explicit MersenneRandomSource(uint32_t seed);

  size_t PickIndex(size_t count) override;

private:
  std::mt19937 m_generator;
};
