/// @file tests/statistics/test_distance.cpp
/// @brief Tests for distance matrices, adjacency, transforms and Pearson r.

#include "stint/distance.hpp"
#include "stint/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace stint;

TEST(DistanceTest, spatial_matrix_is_symmetric_with_zero_diagonal) {
    SpatialCoords pts(3, 2);
    pts << 0.0, 0.0,
           3.0, 4.0,
           6.0, 8.0;
    const auto d = distance::spatial(pts);

    EXPECT_DOUBLE_EQ(d(0, 1), 5.0);
    EXPECT_DOUBLE_EQ(d(2, 0), 10.0);
    EXPECT_DOUBLE_EQ(d(1, 2), d(2, 1));
    EXPECT_DOUBLE_EQ(d.diagonal().sum(), 0.0);
}

TEST(DistanceTest, temporal_matrix_is_absolute_difference) {
    TemporalCoords t(3);
    t << 4.0, 1.0, 10.0;
    const auto d = distance::temporal(t);
    EXPECT_DOUBLE_EQ(d(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(d(1, 2), 9.0);
}

TEST(DistanceTest, within_includes_diagonal_and_boundary) {
    TemporalCoords t(3);
    t << 0.0, 2.0, 5.0;
    const auto adj = distance::within(distance::temporal(t), 2.0);

    EXPECT_TRUE(adj(0, 0));
    EXPECT_TRUE(adj(0, 1));
    EXPECT_TRUE(adj(1, 0));
    EXPECT_FALSE(adj(0, 2));
    EXPECT_FALSE(adj(1, 2));
    EXPECT_EQ(adj.count(), 5);
}

TEST(DistanceTest, lower_triangle_is_row_major_below_diagonal) {
    DistanceMatrix m(3, 3);
    m << 0, 9, 9,
         1, 0, 9,
         2, 3, 0;
    const auto v = distance::lower_triangle(m);
    ASSERT_EQ(v.size(), 3);
    EXPECT_DOUBLE_EQ(v(0), 1.0);
    EXPECT_DOUBLE_EQ(v(1), 2.0);
    EXPECT_DOUBLE_EQ(v(2), 3.0);
}

TEST(DistanceTest, power_transform_applies_constant_then_power) {
    Eigen::ArrayXXd d(1, 3);
    d << 0.0, 1.0, 3.0;
    const auto inv = distance::power_transform(d, 1.0, -1.0);
    EXPECT_DOUBLE_EQ(inv(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(inv(0, 1), 0.5);
    EXPECT_DOUBLE_EQ(inv(0, 2), 0.25);

    const auto same = distance::power_transform(d, 0.0, 1.0);
    EXPECT_DOUBLE_EQ(same(0, 2), 3.0);
}

TEST(DistanceTest, pearson_known_values) {
    Eigen::VectorXd a(3);
    Eigen::VectorXd b(3);
    a << 2.0, 1.0, 1.0;
    b << 1.0, 3.0, 2.0;
    EXPECT_NEAR(distance::pearson(a, b), -std::sqrt(3.0) / 2.0, 1e-12);
    EXPECT_NEAR(distance::pearson(a, a), 1.0, 1e-12);
    EXPECT_NEAR(distance::pearson(a, -a), -1.0, 1e-12);
}

TEST(DistanceTest, pearson_rejects_degenerate_inputs) {
    Eigen::VectorXd a(3);
    Eigen::VectorXd constant = Eigen::VectorXd::Constant(3, 4.0);
    a << 1.0, 2.0, 3.0;
    EXPECT_THROW((void)distance::pearson(a, constant), NumericDegeneracy);

    Eigen::VectorXd with_inf = a;
    with_inf(1) = std::numeric_limits<double>::infinity();
    EXPECT_THROW((void)distance::pearson(a, with_inf), NumericDegeneracy);

    Eigen::VectorXd shorter(2);
    shorter << 1.0, 2.0;
    EXPECT_THROW((void)distance::pearson(a, shorter), InvalidInputSize);

    Eigen::VectorXd single(1);
    single << 1.0;
    EXPECT_THROW((void)distance::pearson(single, single), NumericDegeneracy);
}
