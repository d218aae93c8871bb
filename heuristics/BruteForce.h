#pragma once
#include <vector>
#include "../core/DistanceModel.h"
#include "TourSolver.h"

namespace BruteForce {

    /**
     * @brief Exact solver. Sorts the selected cities by pool order, walks every
     * permutation with next_permutation and keeps the first strictly shorter tour,
     * so ties resolve to the lexicographically smallest order.
     * @param selected Non-home cities to visit, 1..MAX_SELECTED_CITIES of them.
     * @return The optimal closed tour home -> ... -> home.
     * Throws InvalidRouteError on an invalid selection.
     */
    Tour solve_exact(const DistanceModel& M, int home, const std::vector<int>& selected);

} // namespace BruteForce
