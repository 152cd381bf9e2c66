#include "qfolio/selection/weight_allocator.hpp"
#include "qfolio/risk/performance_metrics.hpp"
#include "qfolio/selection/series_math.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace qfolio {

namespace {

// Tail weights for the sorted-descending losses: 1 for the first ⌊q⌋
// entries, the fractional remainder for the next one, all divided by q.
struct TailEvaluation {
  double value{0.0};
  std::vector<double> subgradient;
};

TailEvaluation evaluateTail(const std::vector<std::vector<double>>& returns,
                            const std::vector<double>& w, double confidence) {
  const std::size_t periods = returns.size();
  const std::size_t k = w.size();

  std::vector<std::pair<double, std::size_t>> losses(periods);
  for (std::size_t t = 0; t < periods; ++t) {
    double r = 0.0;
    for (std::size_t i = 0; i < k; ++i) {
      r += returns[t][i] * w[i];
    }
    losses[t] = {-r, t};
  }
  // Stable tie order keeps the subgradient deterministic.
  std::stable_sort(losses.begin(), losses.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });

  double q = (1.0 - confidence) * static_cast<double>(periods);
  q = std::max(q, 1.0);
  q = std::min(q, static_cast<double>(periods));
  const auto whole = static_cast<std::size_t>(std::floor(q));
  const double frac = q - static_cast<double>(whole);

  TailEvaluation out;
  out.subgradient.assign(k, 0.0);
  auto accumulate = [&](std::size_t rank, double weight) {
    const auto& [loss, t] = losses[rank];
    out.value += weight * loss;
    for (std::size_t i = 0; i < k; ++i) {
      out.subgradient[i] -= weight * returns[t][i];
    }
  };
  for (std::size_t r = 0; r < whole; ++r) {
    accumulate(r, 1.0);
  }
  if (frac > 0.0 && whole < periods) {
    accumulate(whole, frac);
  }
  out.value /= q;
  for (double& g : out.subgradient) {
    g /= q;
  }
  return out;
}

}  // namespace

WeightAllocator::WeightAllocator(AllocatorConfig config)
    : config_(std::move(config)) {}

domain::TargetWeights WeightAllocator::equalWeights(
    const domain::Selection& selection) {
  domain::TargetWeights weights;
  const int k = selection.count();
  for (std::size_t i = 0; i < selection.assets.size(); ++i) {
    weights[selection.assets[i]] =
        (selection.bits[i] && k > 0) ? 1.0 / static_cast<double>(k) : 0.0;
  }
  return weights;
}

double WeightAllocator::cvar(const std::vector<std::vector<double>>& returns,
                             const std::vector<double>& weights,
                             double confidence) {
  if (returns.empty()) {
    return 0.0;
  }
  return evaluateTail(returns, weights, confidence).value;
}

// -----------------------------------------------------------------------------
// projectBoundedSimplex: find τ with Σ clamp(v_i - τ, lo, hi) = 1
// -----------------------------------------------------------------------------
std::vector<double> WeightAllocator::projectBoundedSimplex(
    const std::vector<double>& v, double lo, double hi) {
  const auto [min_it, max_it] = std::minmax_element(v.begin(), v.end());
  double tau_lo = *min_it - hi;  // every entry at hi → sum ≥ 1
  double tau_hi = *max_it - lo;  // every entry at lo → sum ≤ 1

  std::vector<double> w(v.size());
  auto fill = [&](double tau) {
    double sum = 0.0;
    for (std::size_t i = 0; i < v.size(); ++i) {
      w[i] = series::clamp(v[i] - tau, lo, hi);
      sum += w[i];
    }
    return sum;
  };

  for (int iter = 0; iter < 200; ++iter) {
    const double tau = 0.5 * (tau_lo + tau_hi);
    if (fill(tau) > 1.0) {
      tau_lo = tau;
    } else {
      tau_hi = tau;
    }
  }
  const double sum = fill(0.5 * (tau_lo + tau_hi));
  if (sum > 0.0) {
    for (double& x : w) {
      x /= sum;
    }
  }
  return w;
}

// -----------------------------------------------------------------------------
// allocate()
// -----------------------------------------------------------------------------
Result<AllocationResult> WeightAllocator::allocate(
    const domain::Selection& selection,
    const domain::MarketSnapshot& snapshot) const {
  const auto selected = selection.selectedAssets();
  if (selected.empty()) {
    return makeError(ErrorKind::DegenerateSelection, "no asset selected",
                     "allocation");
  }

  AllocationResult result;
  if (selected.size() == 1) {
    result.weights = equalWeights(selection);
    result.min_weight = result.max_weight = 1.0;
    return result;
  }

  // --- Aligned trailing returns ----------------------------------------------
  std::vector<std::vector<double>> per_asset;
  std::size_t periods = 0;
  for (const auto& asset : selected) {
    auto it = snapshot.find(asset);
    if (it == snapshot.end()) {
      return makeError(ErrorKind::DegenerateSelection,
                       "selected asset has no price history", "allocation",
                       asset);
    }
    per_asset.push_back(series::simpleReturns(it->second));
    periods = per_asset.size() == 1
                  ? per_asset.back().size()
                  : std::min(periods, per_asset.back().size());
  }

  // periods == 0 leaves no row to read, whatever min_observations says.
  if (periods == 0 || periods < config_.min_observations) {
    return makeError(
        ErrorKind::DegenerateSelection, "return history too short for CVaR",
        "allocation", {},
        {{"observations", static_cast<double>(periods)},
         {"min_observations", static_cast<double>(config_.min_observations)}});
  }

  const std::size_t k = selected.size();
  std::vector<std::vector<double>> returns(periods, std::vector<double>(k));
  for (std::size_t i = 0; i < k; ++i) {
    const auto aligned = series::tail(per_asset[i], periods);
    for (std::size_t t = 0; t < periods; ++t) {
      returns[t][i] = aligned[t];
    }
  }

  bool identical = true;
  const double first = returns[0][0];
  for (const auto& row : returns) {
    for (double r : row) {
      if (std::abs(r - first) > 1e-15) {
        identical = false;
      }
    }
  }
  if (identical) {
    return makeError(ErrorKind::DegenerateSelection,
                     "all historical returns are identical", "allocation", {},
                     {{"return", first},
                      {"observations", static_cast<double>(periods)}});
  }

  // --- Objective terms -------------------------------------------------------
  std::vector<double> mu(k, 0.0);
  for (std::size_t i = 0; i < k; ++i) {
    mu[i] = series::mean(series::tail(per_asset[i], periods));
  }

  std::vector<double> tilt(k, 0.0);
  if (config_.performance_weight > 0.0) {
    for (std::size_t i = 0; i < k; ++i) {
      tilt[i] = performanceScore(
          computePerformanceMetrics(series::tail(per_asset[i], periods),
                                    config_.periods_per_year),
          config_.performance_metric);
    }
    const double centre = series::mean(tilt);
    double spread = 0.0;
    for (double& s : tilt) {
      s -= centre;
      spread = std::max(spread, std::abs(s));
    }
    for (double& s : tilt) {
      s = spread > 1e-12 ? s / spread : 0.0;
    }
  }

  // --- Bounds ---------------------------------------------------------------
  const double kd = static_cast<double>(k);
  double lo = config_.min_weight;
  double hi = config_.max_weight;
  if (kd * lo > 1.0) {
    lo = 1.0 / kd;
    result.bounds_relaxed = true;
  }
  if (kd * hi < 1.0) {
    hi = 1.0 / kd;
    result.bounds_relaxed = true;
  }

  auto objective = [&](const std::vector<double>& w, TailEvaluation& tail) {
    tail = evaluateTail(returns, w, config_.confidence);
    double value = config_.risk_aversion * tail.value;
    for (std::size_t i = 0; i < k; ++i) {
      value -= (mu[i] + config_.performance_weight * tilt[i]) * w[i];
    }
    return value;
  };

  // --- Projected subgradient descent ------------------------------------------
  std::vector<double> w =
      projectBoundedSimplex(std::vector<double>(k, 1.0 / kd), lo, hi);
  TailEvaluation tail;
  double f = objective(w, tail);
  std::vector<double> best_w = w;
  double best_f = f;
  double best_cvar = tail.value;

  std::vector<double> g(k);
  for (std::size_t iter = 0; iter < config_.iterations; ++iter) {
    double g_max = 0.0;
    for (std::size_t i = 0; i < k; ++i) {
      g[i] = config_.risk_aversion * tail.subgradient[i] - mu[i] -
             config_.performance_weight * tilt[i];
      g_max = std::max(g_max, std::abs(g[i]));
    }
    if (g_max < 1e-15) {
      break;
    }
    const double step =
        config_.initial_step / std::sqrt(static_cast<double>(iter + 1));
    for (std::size_t i = 0; i < k; ++i) {
      w[i] -= step * g[i] / g_max;
    }
    w = projectBoundedSimplex(w, lo, hi);
    f = objective(w, tail);
    result.iterations = iter + 1;
    if (f < best_f) {
      best_f = f;
      best_w = w;
      best_cvar = tail.value;
    }
  }

  for (std::size_t i = 0; i < selection.assets.size(); ++i) {
    result.weights[selection.assets[i]] = 0.0;
  }
  double expected = 0.0;
  for (std::size_t i = 0; i < k; ++i) {
    result.weights[selected[i]] = best_w[i];
    expected += mu[i] * best_w[i];
  }
  result.cvar = best_cvar;
  result.expected_return = expected;
  result.objective = best_f;
  result.observations = periods;
  result.min_weight = lo;
  result.max_weight = hi;
  return result;
}

}  // namespace qfolio
