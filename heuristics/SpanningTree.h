#pragma once

#include <vector>
#include "../core/DistanceModel.h"
#include "TourSolver.h"

namespace SpanningTree {

    /**
     * @brief Parent of every vertex in the minimum spanning tree over `vertices`
     * (Prim, adjacency matrix, rooted at vertices[0]).
     * vertices[1..] are expected in pool order.
     * The next vertex added is the outside one with the lightest connecting edge,
     * lowest pool index on ties. A parent is only replaced by a strictly lighter
     * edge, so among equal edges the vertex that joined the tree first stays parent.
     * @return parent[i] is a position in `vertices`; parent[0] == -1.
     */
    std::vector<int> prim_parents(const DistanceModel& M, const std::vector<int>& vertices);

    /**
     * @brief MST tour: builds the tree over {home} + selected and walks it in
     * pre-order from home. Children are visited in order of their edge weight to
     * the parent, then pool index. The walk is closed back at home.
     */
    Tour mst_prim_tour(const DistanceModel& M, int home, const std::vector<int>& selected);

} // namespace SpanningTree
