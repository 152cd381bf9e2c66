#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>

namespace qfolio {

// -----------------------------------------------------------------------------
// RandomSource — injectable randomness for the annealer
// -----------------------------------------------------------------------------
//
// @brief  Minimal interface the annealing state machine draws from.
//
// @details
// Each annealing read owns exactly one RandomSource. Sources are never shared
// between reads, so reads may run on different threads without locking and
// produce the same sequence regardless of scheduling.
// -----------------------------------------------------------------------------
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform double in [0, 1).
  virtual double uniform() = 0;

  // Uniform integer in [0, bound). bound must be > 0.
  virtual std::size_t index(std::size_t bound) = 0;
};

// -----------------------------------------------------------------------------
// Mt19937RandomSource
// -----------------------------------------------------------------------------
class Mt19937RandomSource final : public RandomSource {
 public:
  explicit Mt19937RandomSource(std::uint64_t seed);

  double uniform() override;
  std::size_t index(std::size_t bound) override;

 private:
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

// Creates the random source for one read, given the read's index.
using RandomSourceFactory =
    std::function<std::unique_ptr<RandomSource>(std::size_t read_index)>;

// -----------------------------------------------------------------------------
// deriveReadSeed(seed, read_index)
// -----------------------------------------------------------------------------
// SplitMix64 finalizer over (seed, read_index). Neighbouring indices give
// unrelated streams.
// -----------------------------------------------------------------------------
std::uint64_t deriveReadSeed(std::uint64_t seed, std::size_t read_index);

// Deterministic factory: read k gets Mt19937RandomSource(deriveReadSeed(seed, k)).
RandomSourceFactory seededRandomSourceFactory(std::uint64_t seed);

// Non-deterministic factory: one std::random_device draw per factory,
// then derived per read like the seeded variant.
RandomSourceFactory entropyRandomSourceFactory();

}  // namespace qfolio
