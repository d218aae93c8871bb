#pragma once
#include <vector>
#include <string>
#include "Common.h"
#include "DistanceModel.h"

namespace Objective {

    // Sum of D[route[i]][route[i+1]] over consecutive pairs. The route is
    // expected to already contain the closing return to home.
    long long route_distance(const Route& route, const DistanceModel& M);

    // Length of home -> order... -> home without materialising the route.
    long long closed_tour_distance(int home, const std::vector<int>& order, const DistanceModel& M);

    // home, order..., home
    Route close_tour(int home, const std::vector<int>& order);

    /**
     * @brief Checks that a route is a closed tour from home.
     * Valid means: starts and ends at home, every index is inside the model,
     * no non-home city repeats and home does not appear in the middle.
     * @param why If not null, receives the reason on failure.
     */
    bool check(const Route& route, int home, const DistanceModel& M, std::string* why = nullptr);

} // namespace Objective
