#include "Objective.h"
#include <vector>

using namespace std;

namespace Objective {

    long long route_distance(const Route& route, const DistanceModel& M) {
        long long s = 0;
        for (size_t i = 0; i + 1 < route.size(); ++i) {
            s += M.D[route[i]][route[i+1]];
        }
        return s;
    }

    long long closed_tour_distance(int home, const vector<int>& order, const DistanceModel& M) {
        const auto& D = M.D;
        if (order.empty()) return 0;
        long long s = D[home][order.front()];
        for (size_t i = 0; i + 1 < order.size(); ++i) s += D[order[i]][order[i+1]];
        s += D[order.back()][home];
        return s;
    }

    Route close_tour(int home, const vector<int>& order) {
        Route r;
        r.reserve(order.size() + 2);
        r.push_back(home);
        r.insert(r.end(), order.begin(), order.end());
        r.push_back(home);
        return r;
    }

    bool check(const Route& route, int home, const DistanceModel& M, string* why) {
        if (route.size() < 2) { if (why) *why = "route too short"; return false; }
        if (route.front() != home || route.back() != home) {
            if (why) *why = "route must start and end at the home city";
            return false;
        }

        vector<char> seen(M.N, 0);
        for (size_t i = 1; i + 1 < route.size(); ++i) {
            int v = route[i];
            if (v < 0 || v >= M.N) { if (why) *why = "index out of range"; return false; }
            if (v == home) { if (why) *why = "home city repeated inside the route"; return false; }
            if (seen[v]) { if (why) *why = "repeated city"; return false; }
            seen[v] = 1;
        }
        return true;
    }

} // namespace Objective
