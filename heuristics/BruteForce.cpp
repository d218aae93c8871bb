#include "BruteForce.h"

#include <algorithm>   // For sort, next_permutation
#include <climits>     // For LLONG_MAX
#include <vector>

#include "../core/Objective.h"

using namespace std;

namespace BruteForce {

Tour solve_exact(const DistanceModel& M, int home, const vector<int>& selected) {
    validate_selection(M, home, selected);

    vector<int> perm = selected;
    sort(perm.begin(), perm.end());

    long long best = LLONG_MAX;
    vector<int> best_perm;
    do {
        long long d = Objective::closed_tour_distance(home, perm, M);
        if (d < best) { best = d; best_perm = perm; }
    } while (next_permutation(perm.begin(), perm.end()));

    return { Objective::close_tour(home, best_perm), best };
}

} // namespace BruteForce
