#include "qfolio/selection/qubo_problem.hpp"

namespace qfolio {

double QuboProblem::energy(const std::vector<std::uint8_t>& x) const {
  const std::size_t n = size();
  double e = offset;
  for (std::size_t i = 0; i < n; ++i) {
    if (!x[i]) {
      continue;
    }
    e += q(i, i);
    for (std::size_t j = i + 1; j < n; ++j) {
      if (x[j]) {
        e += q(i, j);
      }
    }
  }
  return e;
}

double QuboProblem::flipDelta(const std::vector<std::uint8_t>& x,
                              std::size_t i) const {
  double field = q(i, i);
  for (std::size_t j = 0; j < size(); ++j) {
    if (j != i && x[j]) {
      field += q(i, j);
    }
  }
  return x[i] ? -field : field;
}

}  // namespace qfolio
