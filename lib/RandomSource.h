#ifndef QL_RANDOM_SOURCE_H
#define QL_RANDOM_SOURCE_H

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

namespace ql {

/**
 * Seedable source of randomness shared by the consensus strategies.
 * Every random decision in a run goes through one instance, so a fixed
 * seed reproduces the run.
 */
class RandomSource {
public:
  RandomSource();
  explicit RandomSource(uint64_t seed);
  virtual ~RandomSource() = default;

  void reseed(uint64_t seed);
  uint64_t getSeed() const { return seed_; }

  /**
   * Uniform integer in [0, bound). Returns 0 when bound is 0.
   */
  virtual uint64_t uniform(uint64_t bound);

  template <typename T> void shuffle(std::vector<T> &items) {
    std::shuffle(items.begin(), items.end(), engine_);
  }

private:
  uint64_t seed_{ 0 };
  std::mt19937_64 engine_;
};

} // namespace ql

#endif // QL_RANDOM_SOURCE_H
