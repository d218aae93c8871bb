#pragma once

#include <memory>
#include <random>
#include <string>
#include <vector>

#include "../core/Common.h"
#include "../core/DistanceModel.h"

// A closed tour (home ... home) and its length.
struct Tour {
    Route route;
    long long distance = 0;
};

/**
 * @brief Common capability of every route solver: given a model, the home
 * city and the selected cities, return a closed tour through all of them.
 * Deterministic solvers ignore the random generator.
 */
class TourSolver {
public:
    virtual ~TourSolver() = default;

    // Key used in reports, e.g. "nearest_neighbor".
    virtual std::string name() const = 0;

    // Human-readable cost of the algorithm.
    virtual std::string complexity() const = 0;

    virtual Tour solve(const DistanceModel& M, int home, const std::vector<int>& selected,
                       std::mt19937& rng) const = 0;
};

using SolverPtr = std::unique_ptr<TourSolver>;

/**
 * @brief Rejects selections no solver can work with.
 * Throws InvalidRouteError if the selection is empty, larger than
 * MAX_SELECTED_CITIES, contains home, a duplicate or an index outside the model.
 */
void validate_selection(const DistanceModel& M, int home, const std::vector<int>& selected);

// Solvers that ship with the game.
SolverPtr make_exact_solver();
SolverPtr make_nearest_neighbor_solver();
SolverPtr make_mst_prim_solver();
SolverPtr make_random_search_solver(int budget);
