#include "qfolio/selection/selection_repair.hpp"

#include <algorithm>
#include <limits>

namespace qfolio {

RepairOutcome repairSelection(domain::Selection& selection,
                              const QuboProblem& problem, int n) {
  RepairOutcome outcome;
  const int size = static_cast<int>(selection.bits.size());
  const int target = std::max(0, std::min(n, size));

  int count = selection.count();
  outcome.count_before = count;

  while (count != target) {
    const bool removing = count > target;
    std::size_t pick = 0;
    double best_delta = std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < selection.bits.size(); ++i) {
      const bool selected = selection.bits[i] != 0;
      if (selected != removing) {
        continue;
      }
      const double delta = problem.flipDelta(selection.bits, i);
      if (delta < best_delta) {
        best_delta = delta;
        pick = i;
      }
    }

    selection.bits[pick] = removing ? 0 : 1;
    (removing ? outcome.removed : outcome.added).push_back(
        selection.assets[pick]);
    count += removing ? -1 : 1;
  }

  selection.energy = problem.energy(selection.bits);
  outcome.count_after = count;
  return outcome;
}

}  // namespace qfolio
