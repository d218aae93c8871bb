#include "Greedy.h"

#include <algorithm>   // For sort
#include <climits>     // For LLONG_MAX
#include <vector>

#include "../core/Objective.h"

using namespace std;

namespace GreedyHeuristics {

Tour nearest_neighbor(const DistanceModel& M, int home, const vector<int>& selected) {
    validate_selection(M, home, selected);
    const auto& D = M.D; int K = (int)selected.size();

    // scanning in pool order makes the strict '<' below pick the lowest index on ties
    vector<int> cand = selected;
    sort(cand.begin(), cand.end());

    vector<char> used(K, 0);
    vector<int> path; path.reserve(K);

    int u = home;
    while ((int)path.size() < K) {
        long long best = LLONG_MAX;
        int best_i = -1;
        for (int i = 0; i < K; ++i) if (!used[i]) {
            long long d = D[u][cand[i]];
            if (d < best) { best = d; best_i = i; }
        }
        used[best_i] = 1;
        u = cand[best_i];
        path.push_back(u);
    }

    return { Objective::close_tour(home, path), Objective::closed_tour_distance(home, path, M) };
}

} // namespace GreedyHeuristics
