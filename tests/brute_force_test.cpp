#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "core/DistanceModel.h"
#include "core/Errors.h"
#include "core/InstanceGenerator.h"
#include "core/Objective.h"
#include "heuristics/BruteForce.h"
#include "heuristics/TourSolver.h"

namespace {

DistanceModel abc() {
    return make_distance_model({
        {0, 50, 100},
        {50, 0, 75},
        {100, 75, 0},
    });
}

DistanceModel classic4() {
    return make_distance_model({
        {0, 10, 15, 20},
        {10, 0, 35, 25},
        {15, 35, 0, 30},
        {20, 25, 30, 0},
    });
}

TEST(BruteForce, EqualTourLengthsResolveToFirstPermutation) {
    // A-B-C-A and A-C-B-A are both 225
    Tour t = BruteForce::solve_exact(abc(), 0, {1, 2});
    EXPECT_EQ(t.distance, 225);
    EXPECT_EQ(t.route, (Route{0, 1, 2, 0}));
}

TEST(BruteForce, ResultDoesNotDependOnSelectionOrder) {
    DistanceModel M = classic4();
    Tour a = BruteForce::solve_exact(M, 0, {1, 2, 3});
    Tour b = BruteForce::solve_exact(M, 0, {3, 2, 1});
    EXPECT_EQ(a.route, b.route);
    EXPECT_EQ(a.distance, 80);
    EXPECT_EQ(a.route, (Route{0, 1, 3, 2, 0}));
}

TEST(BruteForce, SingleCityIsAnOutAndBackTrip) {
    Tour t = BruteForce::solve_exact(abc(), 0, {2});
    EXPECT_EQ(t.route, (Route{0, 2, 0}));
    EXPECT_EQ(t.distance, 200);
}

TEST(BruteForce, HomeNeedNotBeTheFirstCity) {
    Tour t = BruteForce::solve_exact(classic4(), 2, {0, 3});
    EXPECT_EQ(t.route.front(), 2);
    EXPECT_EQ(t.route.back(), 2);
    EXPECT_EQ(t.distance, 15 + 20 + 30);
}

TEST(BruteForce, DistanceMatchesRouteSum) {
    GeneratorParams P;
    std::mt19937 rng(5);
    GeneratedInstance G = InstanceGenerator::generate(P, rng);
    std::vector<int> sel;
    for (int c = 0; c < G.model.N && (int)sel.size() < 6; ++c) if (c != G.home) sel.push_back(c);

    Tour t = BruteForce::solve_exact(G.model, G.home, sel);
    EXPECT_EQ(t.distance, Objective::route_distance(t.route, G.model));
    EXPECT_TRUE(Objective::check(t.route, G.home, G.model));
    EXPECT_EQ(t.route.size(), sel.size() + 2);
}

TEST(BruteForce, RejectsInvalidSelections) {
    DistanceModel M = abc();
    EXPECT_THROW(BruteForce::solve_exact(M, 0, {}), InvalidRouteError);
    EXPECT_THROW(BruteForce::solve_exact(M, 0, {0, 1}), InvalidRouteError);
    EXPECT_THROW(BruteForce::solve_exact(M, 0, {1, 1}), InvalidRouteError);
    EXPECT_THROW(BruteForce::solve_exact(M, 0, {5}), InvalidRouteError);

    GeneratorParams P;
    std::mt19937 rng(1);
    GeneratedInstance G = InstanceGenerator::generate(P, rng);
    std::vector<int> nine;
    for (int c = 0; c < G.model.N; ++c) if (c != G.home) nine.push_back(c);
    ASSERT_EQ(nine.size(), 9u);
    EXPECT_THROW(BruteForce::solve_exact(G.model, G.home, nine), InvalidRouteError);
}

TEST(BruteForce, EightCitiesStillSolve) {
    GeneratorParams P;
    std::mt19937 rng(2);
    GeneratedInstance G = InstanceGenerator::generate(P, rng);
    std::vector<int> sel;
    for (int c = 0; c < G.model.N && (int)sel.size() < MAX_SELECTED_CITIES; ++c) {
        if (c != G.home) sel.push_back(c);
    }
    Tour t = BruteForce::solve_exact(G.model, G.home, sel);
    EXPECT_EQ(t.route.size(), 10u);
    // every edge is at least min_distance
    EXPECT_GE(t.distance, 9LL * P.min_distance);
    EXPECT_LE(t.distance, 9LL * P.max_distance);
}

TEST(BruteForce, SolverAdapterReportsName) {
    SolverPtr s = make_exact_solver();
    EXPECT_EQ(s->name(), "bruteforce");
    std::mt19937 rng(0);
    EXPECT_EQ(s->solve(abc(), 0, {2, 1}, rng).distance, 225);
}

}  // namespace
