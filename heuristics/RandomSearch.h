#pragma once
#include <vector>
#include <random>
#include "../core/DistanceModel.h"
#include "TourSolver.h"

namespace RandomSearch {

    constexpr int DEFAULT_BUDGET = 1000;

    // Throws SearchBudgetError if budget <= 0.
    void validate_budget(int budget);

    /**
     * @brief Monte-Carlo baseline: shuffles the selected cities `budget` times
     * and keeps the first strictly shortest tour seen.
     * Reproducible for a fixed rng state, budget and selection.
     */
    Tour run(const DistanceModel& M, int home, const std::vector<int>& selected, int budget, std::mt19937& rng);

} // namespace RandomSearch
