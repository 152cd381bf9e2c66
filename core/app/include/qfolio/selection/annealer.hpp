#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/selection/qubo_problem.hpp"
#include "qfolio/selection/random_source.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// AnnealPhase — states of one simulated-annealing read
// -----------------------------------------------------------------------------
//
//   Initialize   → draw a random starting vector, compute its energy and the
//                  local fields. Always moves to Cool.
//   Cool         → set the temperature for the next level of the geometric
//                  schedule T_k = T_start·(T_end/T_start)^(k/(K-1)), or move
//                  to Terminate once K levels are done or the proposal budget
//                  is spent.
//   AcceptReject → propose one single-bit flip; accept if Δ < 0, else with
//                  probability exp(-Δ/T). After M proposals, back to Cool.
//   Terminate    → absorbing; best-seen state and energy are final.
// -----------------------------------------------------------------------------
enum class AnnealPhase {
  Initialize,
  Cool,
  AcceptReject,
  Terminate,
};

const char* annealPhaseToString(AnnealPhase phase);

// -----------------------------------------------------------------------------
// AnnealRun — one read as an explicit state machine
// -----------------------------------------------------------------------------
//
// @brief  Steps through AnnealPhase transitions on a single QUBO instance
//         with a caller-owned RandomSource.
//
// @details
// advance() performs exactly one transition, which lets tests observe the
// phase sequence; run() loops until Terminate.
//
// Local fields: h_i = Q_ii + Σ_{j≠i} Q_ij x_j, so that flipping bit i changes
// the energy by (1 - 2x_i)·h_i. Fields are updated in O(N) per accepted
// flip; rejected proposals cost O(1).
//
// Lifetime: holds references to the problem, config and random source; all
// must outlive the run.
// -----------------------------------------------------------------------------
class AnnealRun {
 public:
  AnnealRun(const QuboProblem& problem, const AnnealerConfig& config,
            RandomSource& random);

  AnnealPhase phase() const { return phase_; }
  AnnealPhase advance();
  void run();

  const std::vector<std::uint8_t>& bestState() const { return best_; }
  double bestEnergy() const { return best_energy_; }
  double temperature() const { return temperature_; }
  std::size_t proposals() const { return proposals_; }
  std::size_t accepted() const { return accepted_; }

 private:
  void initialize();
  void cool();
  void acceptReject();
  bool budgetExhausted() const;

  const QuboProblem& problem_;
  const AnnealerConfig& config_;
  RandomSource& random_;

  AnnealPhase phase_{AnnealPhase::Initialize};
  std::vector<std::uint8_t> state_;
  std::vector<double> field_;
  double energy_{0.0};

  std::vector<std::uint8_t> best_;
  double best_energy_{0.0};

  double temperature_{0.0};
  double ratio_{1.0};
  std::size_t level_{0};
  std::size_t sweep_{0};
  std::size_t sweep_length_{0};
  std::size_t proposals_{0};
  std::size_t accepted_{0};
};

// -----------------------------------------------------------------------------
// AnnealResult
// -----------------------------------------------------------------------------
//   selection      — best vector over all reads; energy recomputed exactly.
//   best_read      — index of the winning read (lowest index on ties).
//   read_energies  — best energy of every read, by read index.
// -----------------------------------------------------------------------------
struct AnnealResult {
  domain::Selection selection;
  std::size_t best_read{0};
  std::vector<double> read_energies;
  std::size_t total_proposals{0};
};

// -----------------------------------------------------------------------------
// Annealer — best-of-R simulated annealing
// -----------------------------------------------------------------------------
//
// @brief  Runs config.reads independent AnnealRuns and keeps the minimum.
//
// @details
// Random sources are created up front, serially, from the factory (read k
// gets factory(k)). With a fixed seed the factory derives every read's seed
// from (seed, k), so the result is identical whether reads run serially or
// in parallel.
//
// Parallel mode launches reads with std::async in batches of
// hardware_concurrency. Each read writes only its own result slot; the only
// synchronization point is collecting the futures before picking the
// minimum.
//
// No guarantee of global optimality: best-effort.
//
// Errors:
//   EmptyUniverse — the problem has no variables.
// -----------------------------------------------------------------------------
class Annealer {
 public:
  // An empty factory selects seededRandomSourceFactory(config.seed) when a
  // seed is configured, entropyRandomSourceFactory() otherwise.
  explicit Annealer(AnnealerConfig config, RandomSourceFactory factory = {});

  Result<AnnealResult> solve(const QuboProblem& problem) const;

  const AnnealerConfig& config() const { return config_; }

 private:
  AnnealerConfig config_;
  RandomSourceFactory factory_;
};

}  // namespace qfolio
