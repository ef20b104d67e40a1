#include "RandomSource.h"

namespace ql {

RandomSource::RandomSource() : RandomSource(std::random_device{}()) {}

RandomSource::RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

void RandomSource::reseed(uint64_t seed) {
  seed_ = seed;
  engine_.seed(seed);
}

uint64_t RandomSource::uniform(uint64_t bound) {
  if (bound == 0) {
    return 0;
  }
  std::uniform_int_distribution<uint64_t> dist(0, bound - 1);
  return dist(engine_);
}

} // namespace ql
