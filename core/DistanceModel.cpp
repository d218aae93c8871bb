#include "DistanceModel.h"

#include <string>
#include <vector>

#include "Errors.h"

using namespace std;

int DistanceModel::index_of(const string& name) const {
    for (int i = 0; i < N; ++i) {
        if (cities[i] == name) return i;
    }
    return -1;
}

DistanceModel make_distance_model(const vector<vector<int>>& D) {
    int n = (int)D.size();
    if (n < 2 || n > (int)CITY_ALPHABET.size()) {
        throw ConfigurationError("Distance matrix must have between 2 and "
                                 + to_string(CITY_ALPHABET.size()) + " rows");
    }
    for (int i = 0; i < n; ++i) {
        if ((int)D[i].size() != n) throw ConfigurationError("Distance matrix must be square");
        if (D[i][i] != 0) throw ConfigurationError("Distance matrix diagonal must be zero");
        for (int j = 0; j < i; ++j) {
            if (D[i][j] < 0) throw ConfigurationError("Distances must be non-negative");
            if (D[i][j] != D[j][i]) throw ConfigurationError("Distance matrix must be symmetric");
        }
    }

    DistanceModel M;
    M.N = n;
    M.D = D; // own copy
    M.cities.reserve(n);
    for (int i = 0; i < n; ++i) M.cities.push_back(string(1, CITY_ALPHABET[i]));
    return M;
}

vector<string> route_names(const Route& route, const DistanceModel& M) {
    vector<string> out;
    out.reserve(route.size());
    for (int c : route) out.push_back(M.name_of(c));
    return out;
}
