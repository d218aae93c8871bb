#pragma once

#include <random>
#include <string>
#include <utility>
#include <vector>

#include "Common.h"
#include "SessionStore.h"
#include "../heuristics/TourSolver.h"

// Result of one algorithm (or of the player's own route) on one round.
struct AlgorithmResult {
    std::string name;
    std::vector<std::string> route;  // city names, home ... home
    long long distance = 0;
    double elapsed_ms = 0.0;
};

struct EvaluationReport {
    AlgorithmResult user;
    AlgorithmResult optimal;
    bool correct = false;
    std::string message;
    std::vector<AlgorithmResult> algorithms; // exact solver first, then heuristics in registration order

    // nullptr if no algorithm of that name ran
    const AlgorithmResult* find(const std::string& name) const;
};

struct EvaluatorOptions {
    int random_search_budget = 1000;
    int max_selected = MAX_SELECTED_CITIES;
};

/**
 * @brief Judges a submitted route against the exact optimum and the heuristics.
 *
 * The exact solver always runs; heuristics are whatever was registered
 * (nearest_neighbor, mst_prim and random_search by default). evaluate() is
 * const and safe to call from many threads once registration is done.
 */
class Evaluator {
public:
    // Throws ConfigurationError / SearchBudgetError on bad options.
    explicit Evaluator(EvaluatorOptions opts = EvaluatorOptions());

    void add_heuristic(SolverPtr solver);

    /**
     * @brief Validates the route, then times the player's route, the exact
     * solver and every heuristic on the same selection.
     * @param route City names, home-to-home inclusive.
     * @param player Optional name used in the result message.
     * Throws InvalidRouteError before any solver runs if the route is invalid.
     */
    EvaluationReport evaluate(const Session& S, const std::vector<std::string>& route,
                              std::mt19937& rng, const std::string& player = "") const;

    // Route as pool indices. Throws InvalidRouteError with a player-facing message.
    Route parse_route(const Session& S, const std::vector<std::string>& route) const;

    // (algorithm name, complexity) for the exact solver and every heuristic.
    std::vector<std::pair<std::string, std::string>> complexity_table() const;

    const EvaluatorOptions& options() const { return opts_; }

private:
    EvaluatorOptions opts_;
    SolverPtr exact_;
    std::vector<SolverPtr> heuristics_;
};

// "Perfect route, Ann! ..." / "Your route is ... longer than the optimal ..."
std::string result_message(long long user_distance, long long optimal_distance, const std::string& player);
