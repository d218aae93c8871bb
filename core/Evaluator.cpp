#include "Evaluator.h"

#include <string>
#include <utility>
#include <vector>

#include "Errors.h"
#include "Objective.h"
#include "../utils/Timer.h"

using namespace std;

const AlgorithmResult* EvaluationReport::find(const string& name) const {
    for (const auto& a : algorithms) {
        if (a.name == name) return &a;
    }
    return nullptr;
}

string result_message(long long user_distance, long long optimal_distance, const string& player) {
    if (user_distance == optimal_distance) {
        string who = player.empty() ? "" : ", " + player;
        return "Perfect route" + who + "! You matched the optimal distance of "
               + to_string(optimal_distance) + " km.";
    }
    return "Your route is " + to_string(user_distance) + " km, "
           + to_string(user_distance - optimal_distance) + " km longer than the optimal "
           + to_string(optimal_distance) + " km.";
}

Evaluator::Evaluator(EvaluatorOptions opts) : opts_(opts), exact_(make_exact_solver()) {
    if (opts_.max_selected < 1 || opts_.max_selected > MAX_SELECTED_CITIES) {
        throw ConfigurationError("max_selected must be between 1 and " + to_string(MAX_SELECTED_CITIES));
    }
    heuristics_.push_back(make_nearest_neighbor_solver());
    heuristics_.push_back(make_mst_prim_solver());
    heuristics_.push_back(make_random_search_solver(opts_.random_search_budget));
}

void Evaluator::add_heuristic(SolverPtr solver) {
    heuristics_.push_back(move(solver));
}

Route Evaluator::parse_route(const Session& S, const vector<string>& route) const {
    const DistanceModel& M = S.model;
    const string& home = M.name_of(S.home);

    if (route.size() < 2 || route.front() != home || route.back() != home) {
        throw InvalidRouteError("Route must start and end at the home city " + home);
    }

    Route r;
    r.reserve(route.size());
    r.push_back(S.home);
    vector<char> seen(M.N, 0);
    for (size_t i = 1; i + 1 < route.size(); ++i) {
        int c = M.index_of(route[i]);
        if (c < 0) throw InvalidRouteError("Unknown city '" + route[i] + "'");
        if (c == S.home) {
            throw InvalidRouteError("Home city " + home + " can only appear at the start and end of the route");
        }
        if (seen[c]) throw InvalidRouteError("City " + route[i] + " is visited more than once");
        seen[c] = 1;
        r.push_back(c);
    }
    r.push_back(S.home);

    int k = (int)r.size() - 2;
    if (k == 0) throw InvalidRouteError("Choose at least one city to visit besides the home city");
    if (k > opts_.max_selected) {
        throw InvalidRouteError("You can visit at most " + to_string(opts_.max_selected)
                                + " cities (got " + to_string(k) + ")");
    }
    return r;
}

EvaluationReport Evaluator::evaluate(const Session& S, const vector<string>& route,
                                     mt19937& rng, const string& player) const {
    const DistanceModel& M = S.model;
    Route user_route = parse_route(S, route);
    vector<int> selected(user_route.begin() + 1, user_route.end() - 1);

    EvaluationReport R;
    Stopwatch sw;

    R.user.name = "your_route";
    sw.reset();
    R.user.distance = Objective::route_distance(user_route, M);
    R.user.elapsed_ms = sw.elapsed_ms();
    R.user.route = route_names(user_route, M);

    auto run = [&](const TourSolver& solver) {
        AlgorithmResult A;
        A.name = solver.name();
        sw.reset();
        Tour t = solver.solve(M, S.home, selected, rng);
        A.elapsed_ms = sw.elapsed_ms();
        A.distance = t.distance;
        A.route = route_names(t.route, M);
        return A;
    };

    R.algorithms.reserve(heuristics_.size() + 1);
    R.algorithms.push_back(run(*exact_));
    for (const auto& h : heuristics_) R.algorithms.push_back(run(*h));

    R.optimal = R.algorithms.front();
    R.correct = (R.user.distance == R.optimal.distance);
    R.message = result_message(R.user.distance, R.optimal.distance, player);
    return R;
}

vector<pair<string, string>> Evaluator::complexity_table() const {
    vector<pair<string, string>> out;
    out.emplace_back(exact_->name(), exact_->complexity());
    for (const auto& h : heuristics_) out.emplace_back(h->name(), h->complexity());
    return out;
}
