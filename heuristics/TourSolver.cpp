#include "TourSolver.h"

#include <memory>
#include <string>
#include <vector>

#include "../core/Errors.h"
#include "BruteForce.h"
#include "Greedy.h"
#include "SpanningTree.h"
#include "RandomSearch.h"

using namespace std;

void validate_selection(const DistanceModel& M, int home, const vector<int>& selected) {
    if (selected.empty()) {
        throw InvalidRouteError("Choose at least one city to visit besides the home city");
    }
    if ((int)selected.size() > MAX_SELECTED_CITIES) {
        throw InvalidRouteError("You can visit at most " + to_string(MAX_SELECTED_CITIES)
                                + " cities (got " + to_string(selected.size()) + ")");
    }
    vector<char> seen(M.N, 0);
    for (int v : selected) {
        if (v < 0 || v >= M.N) throw InvalidRouteError("Unknown city index " + to_string(v));
        if (v == home) throw InvalidRouteError("The home city cannot be selected as a stop");
        if (seen[v]) throw InvalidRouteError("City " + M.name_of(v) + " is visited more than once");
        seen[v] = 1;
    }
}

namespace {

class ExactSolver : public TourSolver {
public:
    string name() const override { return "bruteforce"; }
    string complexity() const override {
        return "O(n!) - tries every ordering of the chosen cities, guaranteed optimal";
    }
    Tour solve(const DistanceModel& M, int home, const vector<int>& selected, mt19937&) const override {
        return BruteForce::solve_exact(M, home, selected);
    }
};

class NearestNeighborSolver : public TourSolver {
public:
    string name() const override { return "nearest_neighbor"; }
    string complexity() const override {
        return "O(n^2) - always moves to the closest unvisited city, fast but greedy";
    }
    Tour solve(const DistanceModel& M, int home, const vector<int>& selected, mt19937&) const override {
        return GreedyHeuristics::nearest_neighbor(M, home, selected);
    }
};

class MstPrimSolver : public TourSolver {
public:
    string name() const override { return "mst_prim"; }
    string complexity() const override {
        return "O(n^2) - Prim's minimum spanning tree walked in pre-order, at most twice the optimum on metric instances";
    }
    Tour solve(const DistanceModel& M, int home, const vector<int>& selected, mt19937&) const override {
        return SpanningTree::mst_prim_tour(M, home, selected);
    }
};

class RandomSearchSolver : public TourSolver {
public:
    explicit RandomSearchSolver(int budget) : budget_(budget) {}

    string name() const override { return "random_search"; }
    string complexity() const override {
        return "O(k * n) - samples k random orderings (k = " + to_string(budget_)
               + ") and keeps the best, no guarantee";
    }
    Tour solve(const DistanceModel& M, int home, const vector<int>& selected, mt19937& rng) const override {
        return RandomSearch::run(M, home, selected, budget_, rng);
    }

private:
    int budget_;
};

} // namespace

SolverPtr make_exact_solver() { return make_unique<ExactSolver>(); }
SolverPtr make_nearest_neighbor_solver() { return make_unique<NearestNeighborSolver>(); }
SolverPtr make_mst_prim_solver() { return make_unique<MstPrimSolver>(); }

SolverPtr make_random_search_solver(int budget) {
    RandomSearch::validate_budget(budget);
    return make_unique<RandomSearchSolver>(budget);
}
