/**
 * @file  prop_tree_matches_brute_force.cpp
 * @brief Property: ANN k-d tree radius and k-NN queries return exactly what
 *        an all-pairs scan returns.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_tree_matches_brute_force
 *
 * A mismatch would indicate a widened ANN bound that still drops a
 * qualifying point, or a k-NN tie-break that does not prefer the lower index.
 */

#include <rapidcheck.h>

#include "stint/neighbors.hpp"

using namespace stint;

namespace {

Eigen::MatrixXd random_points(std::size_t n, int cols) {
    Eigen::MatrixXd pts(static_cast<Eigen::Index>(n), cols);
    for (Eigen::Index i = 0; i < pts.rows(); ++i) {
        for (Eigen::Index c = 0; c < pts.cols(); ++c) {
            // Integer-valued coordinates produce many exact ties.
            pts(i, c) = *rc::gen::inRange(-50, 50);
        }
    }
    return pts;
}

}  // namespace

int main() {
    // ── Property 1: fixed-radius search ──────────────────────────────────────
    rc::check(
        "tree_matches_brute_force: radius search",
        [] {
            const auto n    = *rc::gen::inRange<std::size_t>(2, 300);
            const int  cols = *rc::gen::inRange(1, 3);
            const auto pts  = random_points(n, cols);
            const double radius = *rc::gen::inRange(0, 40);
            RC_ASSERT(indexed_neighbors(pts, radius) == brute_force_neighbors(pts, radius));
        }
    );

    // ── Property 2: k-nearest with lower-index tie-break ─────────────────────
    rc::check(
        "tree_matches_brute_force: k nearest neighbors",
        [] {
            const auto n    = *rc::gen::inRange<std::size_t>(2, 200);
            const int  cols = *rc::gen::inRange(1, 3);
            const auto pts  = random_points(n, cols);
            const auto k    = *rc::gen::inRange<std::size_t>(1, n);
            RC_ASSERT(k_nearest_neighbors(pts, k) == brute_force_k_nearest(pts, k));
        }
    );

    return 0;
}
