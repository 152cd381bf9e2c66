#include "qfolio/selection/annealer.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>
#include <utility>

namespace qfolio {

const char* annealPhaseToString(AnnealPhase phase) {
  switch (phase) {
    case AnnealPhase::Initialize:   return "Initialize";
    case AnnealPhase::Cool:         return "Cool";
    case AnnealPhase::AcceptReject: return "AcceptReject";
    case AnnealPhase::Terminate:    return "Terminate";
  }
  return "Unknown";
}

// =============================================================================
// AnnealRun
// =============================================================================

AnnealRun::AnnealRun(const QuboProblem& problem, const AnnealerConfig& config,
                     RandomSource& random)
    : problem_(problem), config_(config), random_(random) {
  sweep_length_ =
      config_.sweeps_per_step > 0 ? config_.sweeps_per_step : problem_.size();
  if (sweep_length_ == 0) {
    sweep_length_ = 1;
  }
  if (config_.steps > 1) {
    ratio_ = std::pow(config_.t_end / config_.t_start,
                      1.0 / static_cast<double>(config_.steps - 1));
  }
}

AnnealPhase AnnealRun::advance() {
  switch (phase_) {
    case AnnealPhase::Initialize:
      initialize();
      break;
    case AnnealPhase::Cool:
      cool();
      break;
    case AnnealPhase::AcceptReject:
      acceptReject();
      break;
    case AnnealPhase::Terminate:
      break;
  }
  return phase_;
}

void AnnealRun::run() {
  while (phase_ != AnnealPhase::Terminate) {
    advance();
  }
}

bool AnnealRun::budgetExhausted() const {
  return config_.max_iterations > 0 && proposals_ >= config_.max_iterations;
}

// -----------------------------------------------------------------------------
// Initialize: random start, exact energy, local fields
// -----------------------------------------------------------------------------
void AnnealRun::initialize() {
  const std::size_t n = problem_.size();
  state_.assign(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    state_[i] = random_.uniform() < 0.5 ? 1 : 0;
  }

  field_.assign(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    double h = problem_.q(i, i);
    for (std::size_t j = 0; j < n; ++j) {
      if (j != i && state_[j]) {
        h += problem_.q(i, j);
      }
    }
    field_[i] = h;
  }

  energy_ = problem_.energy(state_);
  best_ = state_;
  best_energy_ = energy_;
  temperature_ = config_.t_start;
  level_ = 0;
  phase_ = (n == 0) ? AnnealPhase::Terminate : AnnealPhase::Cool;
}

// -----------------------------------------------------------------------------
// Cool: next temperature level, or terminate
// -----------------------------------------------------------------------------
void AnnealRun::cool() {
  if (level_ >= config_.steps || budgetExhausted()) {
    phase_ = AnnealPhase::Terminate;
    return;
  }
  temperature_ = config_.t_start * std::pow(ratio_, static_cast<double>(level_));
  // Guard against overshooting the floor through rounding.
  temperature_ = std::max(temperature_, config_.t_end);
  sweep_ = 0;
  phase_ = AnnealPhase::AcceptReject;
}

// -----------------------------------------------------------------------------
// AcceptReject: one Metropolis proposal
// -----------------------------------------------------------------------------
void AnnealRun::acceptReject() {
  const std::size_t n = problem_.size();
  const std::size_t i = random_.index(n);
  const double delta = state_[i] ? -field_[i] : field_[i];

  bool accept = delta < 0.0;
  if (!accept) {
    accept = random_.uniform() < std::exp(-delta / temperature_);
  }

  if (accept) {
    state_[i] ^= 1;
    energy_ += delta;
    const double sign = state_[i] ? 1.0 : -1.0;
    for (std::size_t j = 0; j < n; ++j) {
      if (j != i) {
        field_[j] += sign * problem_.q(i, j);
      }
    }
    ++accepted_;
    if (energy_ < best_energy_) {
      best_energy_ = energy_;
      best_ = state_;
    }
  }

  ++proposals_;
  ++sweep_;
  if (budgetExhausted()) {
    phase_ = AnnealPhase::Terminate;
  } else if (sweep_ >= sweep_length_) {
    ++level_;
    phase_ = AnnealPhase::Cool;
  }
}

// =============================================================================
// Annealer
// =============================================================================

namespace {

struct ReadOutcome {
  std::vector<std::uint8_t> bits;
  double energy{0.0};
  std::size_t proposals{0};
};

ReadOutcome runRead(const QuboProblem& problem, const AnnealerConfig& config,
                    RandomSource& random) {
  AnnealRun run(problem, config, random);
  run.run();
  ReadOutcome out;
  out.bits = run.bestState();
  // Recompute to drop the rounding accumulated by incremental updates.
  out.energy = problem.energy(out.bits);
  out.proposals = run.proposals();
  return out;
}

}  // namespace

Annealer::Annealer(AnnealerConfig config, RandomSourceFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
  if (!factory_) {
    factory_ = config_.seed ? seededRandomSourceFactory(*config_.seed)
                            : entropyRandomSourceFactory();
  }
}

// -----------------------------------------------------------------------------
// solve(): best-of-R
// -----------------------------------------------------------------------------
Result<AnnealResult> Annealer::solve(const QuboProblem& problem) const {
  if (problem.size() == 0) {
    return makeError(ErrorKind::EmptyUniverse, "QUBO has no variables",
                     "annealer");
  }

  const std::size_t reads = std::max<std::size_t>(config_.reads, 1);

  std::vector<std::unique_ptr<RandomSource>> sources;
  sources.reserve(reads);
  for (std::size_t k = 0; k < reads; ++k) {
    sources.push_back(factory_(k));
  }

  std::vector<ReadOutcome> outcomes(reads);

  if (config_.parallel && reads > 1) {
    const std::size_t batch = std::max<std::size_t>(
        std::thread::hardware_concurrency(), 1);
    for (std::size_t start = 0; start < reads; start += batch) {
      const std::size_t end = std::min(reads, start + batch);
      std::vector<std::future<void>> pending;
      pending.reserve(end - start);
      for (std::size_t k = start; k < end; ++k) {
        pending.push_back(std::async(std::launch::async, [&, k] {
          outcomes[k] = runRead(problem, config_, *sources[k]);
        }));
      }
      for (auto& f : pending) {
        f.get();
      }
    }
  } else {
    for (std::size_t k = 0; k < reads; ++k) {
      outcomes[k] = runRead(problem, config_, *sources[k]);
    }
  }

  AnnealResult result;
  result.read_energies.reserve(reads);
  std::size_t best = 0;
  for (std::size_t k = 0; k < reads; ++k) {
    result.read_energies.push_back(outcomes[k].energy);
    result.total_proposals += outcomes[k].proposals;
    if (outcomes[k].energy < outcomes[best].energy) {
      best = k;
    }
  }

  result.best_read = best;
  result.selection.assets = problem.assets;
  result.selection.bits = std::move(outcomes[best].bits);
  result.selection.energy = outcomes[best].energy;
  return result;
}

}  // namespace qfolio
