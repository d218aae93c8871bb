#include "RandomSearch.h"

#include <algorithm>   // For sort, shuffle
#include <climits>     // For LLONG_MAX
#include <string>
#include <vector>

#include "../core/Errors.h"
#include "../core/Objective.h"

using namespace std;

namespace RandomSearch {

void validate_budget(int budget) {
    if (budget <= 0) {
        throw SearchBudgetError("random search budget must be positive (got " + to_string(budget) + ")");
    }
}

Tour run(const DistanceModel& M, int home, const vector<int>& selected, int budget, mt19937& rng) {
    validate_budget(budget);
    validate_selection(M, home, selected);

    // start from pool order so the result depends only on the rng, not on the caller's order
    vector<int> order = selected;
    sort(order.begin(), order.end());

    long long best = LLONG_MAX;
    vector<int> best_order;
    for (int s = 0; s < budget; ++s) {
        shuffle(order.begin(), order.end(), rng);
        long long d = Objective::closed_tour_distance(home, order, M);
        if (d < best) { best = d; best_order = order; }
    }

    return { Objective::close_tour(home, best_order), best };
}

} // namespace RandomSearch
