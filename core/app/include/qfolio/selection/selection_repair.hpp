#pragma once

#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/selection/qubo_problem.hpp"

#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// RepairOutcome
// -----------------------------------------------------------------------------
struct RepairOutcome {
  int count_before{0};
  int count_after{0};
  std::vector<std::string> removed;
  std::vector<std::string> added;

  bool repaired() const { return !removed.empty() || !added.empty(); }
};

// -----------------------------------------------------------------------------
// repairSelection(selection, problem, n)
// -----------------------------------------------------------------------------
//
// @brief  Forces the selection to exactly n ones, greedily.
//
// @details
// While more than n assets are selected, the selected asset whose removal
// raises H the least (most negative flip delta) is dropped; while fewer are
// selected, the unselected asset whose addition raises H the least is added.
// Ties go to the lower index. selection.energy is updated to the energy of
// the repaired vector. n is clamped to [0, universe size].
// -----------------------------------------------------------------------------
RepairOutcome repairSelection(domain::Selection& selection,
                              const QuboProblem& problem, int n);

}  // namespace qfolio
