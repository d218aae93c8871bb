#pragma once

#include <vector>
#include <string>
#include "Common.h"

// City set plus the symmetric distance matrix of one round.
// D[i][j] aligns with cities[i] / cities[j]. Never modified after generation.
struct DistanceModel {
    std::vector<std::string> cities;
    std::vector<std::vector<int>> D;
    int N = 0;

    // Pool index of a city name, or -1 if the name is not part of this model.
    int index_of(const std::string& name) const;

    const std::string& name_of(int city) const { return cities[city]; }
};

/**
 * @brief Builds a model from an explicit matrix (used by tests and the benchmark).
 * City names are the first N letters of the alphabet.
 * Throws ConfigurationError if the matrix is not square, has fewer than 2 rows,
 * has a non-zero diagonal, a negative entry or is not symmetric.
 */
DistanceModel make_distance_model(const std::vector<std::vector<int>>& D);

// Maps a route of city indices to city names.
std::vector<std::string> route_names(const Route& route, const DistanceModel& M);
