#include "SpanningTree.h"

#include <algorithm>   // For sort
#include <climits>     // For LLONG_MAX
#include <vector>

#include "../core/Objective.h"

using namespace std;

namespace SpanningTree {

vector<int> prim_parents(const DistanceModel& M, const vector<int>& vertices) {
    const auto& D = M.D;
    int n = (int)vertices.size();

    vector<long long> key(n, LLONG_MAX);
    vector<int> parent(n, -1);
    vector<char> in_tree(n, 0);
    key[0] = 0;

    for (int step = 0; step < n; ++step) {
        // lightest outside vertex; strict '<' keeps the lowest position on ties
        int u = -1;
        for (int i = 0; i < n; ++i) {
            if (!in_tree[i] && (u == -1 || key[i] < key[u])) u = i;
        }
        in_tree[u] = 1;

        for (int v = 0; v < n; ++v) {
            if (in_tree[v]) continue;
            long long w = D[vertices[u]][vertices[v]];
            if (w < key[v]) { key[v] = w; parent[v] = u; }
        }
    }
    return parent;
}

Tour mst_prim_tour(const DistanceModel& M, int home, const vector<int>& selected) {
    validate_selection(M, home, selected);
    const auto& D = M.D;

    vector<int> vertices;
    vertices.reserve(selected.size() + 1);
    vertices.push_back(home);
    vector<int> rest = selected;
    sort(rest.begin(), rest.end());
    vertices.insert(vertices.end(), rest.begin(), rest.end());

    int n = (int)vertices.size();
    vector<int> parent = prim_parents(M, vertices);

    vector<vector<int>> children(n);
    for (int v = 1; v < n; ++v) children[parent[v]].push_back(v);
    for (int u = 0; u < n; ++u) {
        // positions follow pool order, so comparing positions breaks weight ties by city
        sort(children[u].begin(), children[u].end(), [&](int a, int b) {
            int wa = D[vertices[u]][vertices[a]];
            int wb = D[vertices[u]][vertices[b]];
            if (wa != wb) return wa < wb;
            return a < b;
        });
    }

    // iterative pre-order walk; children pushed in reverse so the first is popped first
    vector<int> order;
    order.reserve(n - 1);
    vector<int> stack{0};
    while (!stack.empty()) {
        int u = stack.back(); stack.pop_back();
        if (u != 0) order.push_back(vertices[u]);
        for (auto it = children[u].rbegin(); it != children[u].rend(); ++it) stack.push_back(*it);
    }

    return { Objective::close_tour(home, order), Objective::closed_tour_distance(home, order, M) };
}

} // namespace SpanningTree
