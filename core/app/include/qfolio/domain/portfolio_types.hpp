#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// VolatilityRegime
// -----------------------------------------------------------------------------
enum class VolatilityRegime {
  LowVolatility,
  Normal,
  HighVolatility,
};

inline const char* volatilityRegimeToString(VolatilityRegime regime) {
  switch (regime) {
    case VolatilityRegime::LowVolatility:  return "LOW_VOLATILITY";
    case VolatilityRegime::Normal:         return "NORMAL";
    case VolatilityRegime::HighVolatility: return "HIGH_VOLATILITY";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// RegimeParameters — output of the RegimeDetector
// -----------------------------------------------------------------------------
//   n            — target portfolio size.
//   lambda       — risk-penalty weight for the Hamiltonian.
//   volatility   — annualized volatility the mapping was computed from.
//   observations — return observations per asset actually used.
// -----------------------------------------------------------------------------
struct RegimeParameters {
  int n{0};
  double lambda{0.0};
  double volatility{0.0};
  VolatilityRegime regime{VolatilityRegime::Normal};
  std::size_t observations{0};
};

// -----------------------------------------------------------------------------
// AlphaVector
// -----------------------------------------------------------------------------
// Parallel arrays: scores[i] belongs to assets[i]. The asset order defines
// the QUBO variable indexing for the rest of the cycle.
// -----------------------------------------------------------------------------
struct AlphaVector {
  std::vector<std::string> assets;
  std::vector<double> scores;

  std::size_t size() const { return assets.size(); }
  bool empty() const { return assets.empty(); }
};

// -----------------------------------------------------------------------------
// CorrelationMatrix
// -----------------------------------------------------------------------------
// Row-major size×size matrix over `assets`. Symmetric, unit diagonal,
// entries in [-1, 1].
// -----------------------------------------------------------------------------
struct CorrelationMatrix {
  std::vector<std::string> assets;
  std::vector<double> values;

  std::size_t size() const { return assets.size(); }

  double operator()(std::size_t i, std::size_t j) const {
    return values[i * assets.size() + j];
  }

  double& operator()(std::size_t i, std::size_t j) {
    return values[i * assets.size() + j];
  }

  static CorrelationMatrix identity(const std::vector<std::string>& assets) {
    CorrelationMatrix m;
    m.assets = assets;
    m.values.assign(assets.size() * assets.size(), 0.0);
    for (std::size_t i = 0; i < assets.size(); ++i) {
      m(i, i) = 1.0;
    }
    return m;
  }
};

// -----------------------------------------------------------------------------
// Selection — binary vector over the asset universe
// -----------------------------------------------------------------------------
// bits[i] == 1 means assets[i] is selected. energy is the Hamiltonian value
// of this exact vector (including the constant offset).
// -----------------------------------------------------------------------------
struct Selection {
  std::vector<std::string> assets;
  std::vector<std::uint8_t> bits;
  double energy{0.0};

  int count() const {
    int c = 0;
    for (auto b : bits) {
      c += b ? 1 : 0;
    }
    return c;
  }

  std::vector<std::string> selectedAssets() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < assets.size(); ++i) {
      if (bits[i]) {
        out.push_back(assets[i]);
      }
    }
    return out;
  }
};

// asset → target weight. Selected assets carry weights summing to 1;
// unselected universe assets are present with weight 0.
using TargetWeights = std::map<std::string, double>;

}  // namespace domain
}  // namespace qfolio
