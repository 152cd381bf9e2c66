#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// QuboProblem — quadratic unconstrained binary optimization instance
// -----------------------------------------------------------------------------
//
// @brief  H(x) = offset + Σ_i Q_ii x_i + Σ_{i<j} Q_ij x_i x_j over x ∈ {0,1}^N.
//
// @details
// Produced by the HamiltonianBuilder and consumed once by the Annealer.
// The matrix is stored dense, row-major and symmetric: Q_ij == Q_ji holds
// the full pair coefficient (not half of it), and only i<j pairs are
// summed. offset makes energy() equal the Hamiltonian exactly, including
// the constant P·n² of the cardinality penalty.
//
// Besides the matrix the instance carries the parameters it was built from
// so that annealing results and the audit trail are self-describing.
// -----------------------------------------------------------------------------
struct QuboProblem {
  std::vector<std::string> assets;
  std::vector<double> alpha;
  std::vector<double> coefficients;  // N×N, row-major
  double offset{0.0};
  double penalty{0.0};
  double lambda{0.0};
  int target_count{0};

  std::size_t size() const { return assets.size(); }

  double q(std::size_t i, std::size_t j) const {
    return coefficients[i * assets.size() + j];
  }

  // Full Hamiltonian of the binary vector x (size() entries of 0/1).
  double energy(const std::vector<std::uint8_t>& x) const;

  // -------------------------------------------------------------------------
  // flipDelta(x, i)
  // -------------------------------------------------------------------------
  // @brief  Energy change caused by flipping bit i of x.
  //
  // @details
  // Δ = (1 - 2x_i) · (Q_ii + Σ_{j≠i} Q_ij x_j). O(N); the annealer keeps
  // the bracketed "local field" incrementally instead.
  // -------------------------------------------------------------------------
  double flipDelta(const std::vector<std::uint8_t>& x, std::size_t i) const;
};

}  // namespace qfolio
