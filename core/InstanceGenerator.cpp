#include "InstanceGenerator.h"

#include <string>
#include <vector>

#include "Errors.h"

using namespace std;

namespace InstanceGenerator {

void validate(const GeneratorParams& P) {
    if (P.pool_size < 2) {
        throw ConfigurationError("pool size must be at least 2 (got " + to_string(P.pool_size) + ")");
    }
    if (P.pool_size > (int)CITY_ALPHABET.size()) {
        throw ConfigurationError("pool size must be at most " + to_string(CITY_ALPHABET.size())
                                 + " (got " + to_string(P.pool_size) + ")");
    }
    if (P.min_distance < 0) {
        throw ConfigurationError("minimum distance must be non-negative");
    }
    if (P.min_distance > P.max_distance) {
        throw ConfigurationError("minimum distance " + to_string(P.min_distance)
                                 + " exceeds maximum distance " + to_string(P.max_distance));
    }
}

GeneratedInstance generate(const GeneratorParams& P, mt19937& rng) {
    validate(P);

    GeneratedInstance G;
    DistanceModel& M = G.model;
    M.N = P.pool_size;
    M.cities.reserve(M.N);
    for (int i = 0; i < M.N; ++i) M.cities.push_back(string(1, CITY_ALPHABET[i]));

    uniform_int_distribution<int> dist(P.min_distance, P.max_distance);
    M.D.assign(M.N, vector<int>(M.N, 0));
    for (int i = 0; i < M.N; ++i) {
        for (int j = i+1; j < M.N; ++j) {
            M.D[i][j] = M.D[j][i] = dist(rng); // symmetric
        }
    }

    G.home = uniform_int_distribution<int>(0, M.N - 1)(rng);
    return G;
}

} // namespace InstanceGenerator
