#include "qfolio/selection/random_source.hpp"

namespace qfolio {

Mt19937RandomSource::Mt19937RandomSource(std::uint64_t seed)
    : engine_(seed) {}

double Mt19937RandomSource::uniform() { return unit_(engine_); }

std::size_t Mt19937RandomSource::index(std::size_t bound) {
  std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
  return dist(engine_);
}

std::uint64_t deriveReadSeed(std::uint64_t seed, std::size_t read_index) {
  std::uint64_t z = seed + 0x9E3779B97F4A7C15ULL *
                               (static_cast<std::uint64_t>(read_index) + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

RandomSourceFactory seededRandomSourceFactory(std::uint64_t seed) {
  return [seed](std::size_t read_index) -> std::unique_ptr<RandomSource> {
    return std::make_unique<Mt19937RandomSource>(
        deriveReadSeed(seed, read_index));
  };
}

RandomSourceFactory entropyRandomSourceFactory() {
  std::random_device device;
  const std::uint64_t seed =
      (static_cast<std::uint64_t>(device()) << 32) ^ device();
  return seededRandomSourceFactory(seed);
}

}  // namespace qfolio
