#pragma once
#include "../core/DistanceModel.h"
#include "TourSolver.h"
#include <vector>

namespace GreedyHeuristics {

    // NN from home: always step to the closest unvisited selected city,
    // lowest pool index on ties, then return home.
    Tour nearest_neighbor(const DistanceModel& M, int home, const std::vector<int>& selected);

} // namespace GreedyHeuristics
