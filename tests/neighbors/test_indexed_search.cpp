/// @file tests/neighbors/test_indexed_search.cpp
/// @brief Tests for ANN-backed radius and k-nearest relations.

#include "stint/neighbors.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace stint;

namespace {

Eigen::MatrixXd random_cloud(Eigen::Index n, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> g(0.0, 25.0);
    Eigen::MatrixXd pts(n, 2);
    for (Eigen::Index i = 0; i < n; ++i) {
        pts(i, 0) = g(rng);
        pts(i, 1) = g(rng);
    }
    return pts;
}

}  // anonymous namespace

// ─── Radius search ────────────────────────────────────────────────────────────

TEST(IndexedSearchTest, excludes_owner_and_is_sorted) {
    Eigen::MatrixXd pts(4, 2);
    pts << 0.0, 0.0,
           0.5, 0.0,
           0.0, 0.5,
           9.0, 9.0;
    const auto sets = indexed_neighbors(pts, 1.0);

    EXPECT_EQ(sets.of(0), (IndexList{1, 2}));
    EXPECT_EQ(sets.of(1), (IndexList{0, 2}));
    EXPECT_EQ(sets.of(3), IndexList{});
    EXPECT_EQ(indexed_neighbors(pts, -1.0).pair_count(), 0u);
}

TEST(IndexedSearchTest, boundary_distance_is_inclusive) {
    Eigen::MatrixXd pts(3, 2);
    pts << 0.0, 0.0,
           3.0, 4.0,
           6.0, 8.0;
    const auto sets = indexed_neighbors(pts, 5.0);
    EXPECT_EQ(sets.of(0), IndexList{1});
    EXPECT_EQ(sets.of(1), (IndexList{0, 2}));
    EXPECT_EQ(sets, brute_force_neighbors(pts, 5.0));
}

TEST(IndexedSearchTest, matches_brute_force_on_random_cloud) {
    const Eigen::MatrixXd pts = random_cloud(300, 5u);
    for (double radius : {0.5, 4.0, 20.0}) {
        EXPECT_EQ(indexed_neighbors(pts, radius), brute_force_neighbors(pts, radius))
            << "r=" << radius;
    }
}

TEST(IndexedSearchTest, one_dimensional_points) {
    Eigen::MatrixXd t(5, 1);
    t << 1.0, 2.0, 3.0, 10.0, 10.5;
    EXPECT_EQ(indexed_neighbors(t, 1.0), brute_force_neighbors(t, 1.0));
    EXPECT_EQ(indexed_neighbors(t, 1.0).of(1), (IndexList{0, 2}));
}

TEST(IndexedSearchTest, duplicate_points_are_all_reported) {
    const Eigen::MatrixXd pts = Eigen::MatrixXd::Constant(50, 2, 3.0);
    const auto sets = indexed_neighbors(pts, 0.0);
    EXPECT_EQ(sets.of(7).size(), 49u);
    EXPECT_EQ(sets.pair_count(), 50u * 49u / 2u);
}

// ─── k nearest ────────────────────────────────────────────────────────────────

TEST(IndexedSearchTest, nearest_breaks_ties_toward_lower_index) {
    Eigen::MatrixXd pts(5, 1);
    pts << 0.0, 2.0, -2.0, 1.0, 5.0;

    // From 0.0: 3 at 1, then 1 and 2 tie at 2; k = 2 keeps the lower index.
    const auto two = k_nearest_neighbors(pts, 2);
    EXPECT_EQ(two.of(0), (IndexList{1, 3}));
    EXPECT_EQ(two, brute_force_k_nearest(pts, 2));
}

TEST(IndexedSearchTest, nearest_among_many_duplicates) {
    Eigen::MatrixXd pts = Eigen::MatrixXd::Zero(12, 2);
    pts(11, 0) = 1.0;
    for (std::size_t k : {1u, 3u, 10u, 11u}) {
        EXPECT_EQ(k_nearest_neighbors(pts, k), brute_force_k_nearest(pts, k)) << "k=" << k;
    }
    EXPECT_EQ(k_nearest_neighbors(pts, 3).of(0), (IndexList{1, 2, 3}));
}

TEST(IndexedSearchTest, nearest_matches_brute_force_on_random_cloud) {
    const Eigen::MatrixXd pts = random_cloud(200, 9u);
    for (std::size_t k : {1u, 3u, 8u}) {
        EXPECT_EQ(k_nearest_neighbors(pts, k), brute_force_k_nearest(pts, k)) << "k=" << k;
    }
}

TEST(IndexedSearchTest, nearest_caps_k_at_other_points) {
    Eigen::MatrixXd pts(3, 1);
    pts << 0.0, 1.0, 4.0;
    const auto sets = k_nearest_neighbors(pts, 10);
    EXPECT_EQ(sets.of(0), (IndexList{1, 2}));
    EXPECT_EQ(sets.of(2), (IndexList{0, 1}));
}
