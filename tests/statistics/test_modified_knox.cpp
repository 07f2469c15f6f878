/// @file tests/statistics/test_modified_knox.cpp
/// @brief Tests for the modified Knox statistic and its permutation test.

#include "stint/modified_knox.hpp"
#include "stint/distance.hpp"
#include "stint/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace stint;

namespace {

EventSet make_events(const std::vector<double>& x, const std::vector<double>& t) {
    const std::vector<double> y(x.size(), 0.0);
    return EventSet(x, y, t);
}

}  // anonymous namespace

TEST(ModifiedKnoxTest, three_event_statistic) {
    // One close pair in both domains; third event isolated.
    //   observed = 2 ordered pairs, expected = Σ sdeg·tdeg = 2
    //   stat = (2 − 2/2) / 2
    const auto events = make_events({0.0, 1.0, 5.0}, {0.0, 1.0, 10.0});
    const auto result = modified_knox(
        events, ModifiedKnoxConfig{.delta = 2.0, .tau = 2.0, .permutations = 0});

    EXPECT_DOUBLE_EQ(result.stat, 0.5);
    EXPECT_FALSE(result.pvalue.has_value());
    EXPECT_FALSE(result.distribution.has_value());
}

TEST(ModifiedKnoxTest, statistic_under_identity_matches_direct_formula) {
    const auto events = make_events({0.0, 1.0, 10.0, 11.0}, {0.0, 1.0, 0.5, 20.0});
    const auto s = distance::within(distance::spatial(events.space()), 2.0);
    const auto t = distance::within(distance::temporal(events.time()), 2.0);

    // 2 ordered space-time pairs; sdeg = (1,1,1,1), tdeg = (2,2,2,0).
    EXPECT_DOUBLE_EQ(modified_knox_statistic(s, t, identity_labeling(4)), 0.0);
    // Swapping the last two time labels moves the isolated time onto event 2.
    EXPECT_DOUBLE_EQ(modified_knox_statistic(s, t, Labeling{0, 1, 3, 2}), 0.0);
}

TEST(ModifiedKnoxTest, relabeling_invariant_configuration_gives_unit_p_value) {
    // Every relabeling of this configuration yields the same statistic, so
    // every trial ties the observed value.
    const auto events = make_events({0.0, 1.0, 10.0, 11.0}, {0.0, 1.0, 0.5, 20.0});
    PermutationEngine engine(123u);
    const auto result = modified_knox(
        events,
        ModifiedKnoxConfig{.delta = 2.0, .tau = 2.0, .permutations = 19, .keep = true},
        engine);

    ASSERT_TRUE(result.pvalue.has_value());
    EXPECT_DOUBLE_EQ(*result.pvalue, 1.0);
    ASSERT_TRUE(result.distribution.has_value());
    EXPECT_EQ(result.distribution->size(), 19u);
    for (double v : *result.distribution) EXPECT_DOUBLE_EQ(v, 0.0);
}

TEST(ModifiedKnoxTest, p_value_lies_on_lattice) {
    const auto events = make_events({0, 1, 2, 8, 9, 15, 16, 30},
                                    {0, 2, 1, 20, 21, 5, 40, 41});
    PermutationEngine engine(5u);
    const std::size_t P = 49;
    const auto result = modified_knox(
        events, ModifiedKnoxConfig{.delta = 2.5, .tau = 3.0, .permutations = P}, engine);

    ASSERT_TRUE(result.pvalue.has_value());
    const double scaled = *result.pvalue * static_cast<double>(P + 1);
    EXPECT_NEAR(scaled, std::round(scaled), 1e-9);
    EXPECT_GE(*result.pvalue, 1.0 / static_cast<double>(P + 1));
    EXPECT_LE(*result.pvalue, 1.0);
}

TEST(ModifiedKnoxTest, invalid_thresholds_throw) {
    const auto events = make_events({0.0, 1.0}, {0.0, 1.0});
    EXPECT_THROW((void)modified_knox(events, ModifiedKnoxConfig{.delta = -1.0, .tau = 1.0}),
                 InvalidThreshold);
    EXPECT_THROW((void)modified_knox(events, ModifiedKnoxConfig{.delta = 1.0, .tau = std::nan("")}),
                 InvalidThreshold);
}
