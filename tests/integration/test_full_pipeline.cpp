/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end integration tests for the stint pipeline.
///
/// These tests exercise the complete path:
///   CSV text → EventLoader → EventSet → {Knox, local Knox, classic Knox,
///   modified Knox, Mantel, Jacquez} → result reports

#include "stint/event_loader.hpp"
#include "stint/event_set.hpp"
#include "stint/jacquez.hpp"
#include "stint/knox.hpp"
#include "stint/mantel.hpp"
#include "stint/modified_knox.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include <string>

using namespace stint;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// Two tight space-time clusters embedded in uniform background noise.
/// Returns CSV text with columns `x,y,onset` (onset as ISO dates).
std::string make_clustered_csv(std::size_t background, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(0.0, 100.0);
    std::uniform_int_distribution<int> day(1, 28);
    std::uniform_int_distribution<int> month(1, 12);
    std::normal_distribution<double> jitter(0.0, 0.5);

    std::ostringstream out;
    out << "id,x,y,onset\n";
    std::size_t id = 0;
    for (std::size_t i = 0; i < background; ++i) {
        const double x = coord(rng);
        const double y = coord(rng);
        const int    m = month(rng);
        const int    d = day(rng);
        out << id++ << ',' << x << ',' << y << ",2019-"
            << (m < 10 ? "0" : "") << m << '-' << (d < 10 ? "0" : "") << d << '\n';
    }
    for (int cluster = 0; cluster < 2; ++cluster) {
        const double cx = cluster == 0 ? 20.0 : 75.0;
        const double cy = cluster == 0 ? 30.0 : 60.0;
        const int    cm = cluster == 0 ? 3 : 9;
        for (int k = 0; k < 8; ++k) {
            out << id++ << ',' << cx + jitter(rng) << ',' << cy + jitter(rng)
                << ",2019-0" << cm << '-' << 10 + k % 4 << '\n';
        }
    }
    return out.str();
}

LoaderConfig onset_dates() {
    LoaderConfig config;
    config.time_column     = "onset";
    config.infer_timestamp = true;
    return config;
}

}  // anonymous namespace

// ─── Loader → EventSet ────────────────────────────────────────────────────────

TEST(FullPipelineTest, loads_dates_into_event_set) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(30, 1u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    EXPECT_TRUE(cols->dates_converted);
    EXPECT_EQ(cols->size(), 46u);

    const EventSet events(cols->x, cols->y, cols->t);
    EXPECT_EQ(events.size(), 46u);
    EXPECT_DOUBLE_EQ(events.time().minCoeff(), 0.0);
}

// ─── Knox family ──────────────────────────────────────────────────────────────

TEST(FullPipelineTest, clusters_raise_knox_count_above_expectation) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(40, 2u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    const EventSet events(cols->x, cols->y, cols->t);

    PermutationEngine engine(2u);
    const auto r = knox(events, KnoxConfig{.delta = 4.0, .tau = 5.0, .permutations = 99}, engine);

    // Each cluster contributes C(8,2) = 28 space-time pairs.
    EXPECT_GE(r.nst, 56u);
    EXPECT_GT(static_cast<double>(r.nst), r.expected_nst());
    EXPECT_LT(r.p_poisson, 0.01);
    ASSERT_TRUE(r.p_sim.has_value());
    EXPECT_LE(*r.p_sim, 0.05);
    EXPECT_NEAR(r.observed.total(), static_cast<double>(events.pair_count()), 1e-9);
}

TEST(FullPipelineTest, local_knox_flags_cluster_members) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(40, 3u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    const EventSet events(cols->x, cols->y, cols->t);

    PermutationEngine engine(3u);
    const auto r = local_knox(events,
                              KnoxConfig{.delta = 4.0, .tau = 5.0, .permutations = 99}, engine);
    ASSERT_EQ(r.size(), events.size());

    const auto total = std::accumulate(r.nsti.begin(), r.nsti.end(), std::size_t{0});
    EXPECT_EQ(total, 2 * r.global.nst);

    // The last 16 events are the cluster members; each has ≥ 7 space-time
    // neighbors and a small hypergeometric p-value.
    for (std::size_t i = r.size() - 16; i < r.size(); ++i) {
        EXPECT_GE(r.nsti[i], 7u) << "unit " << i;
        EXPECT_LT(r.p_hypergeom[i], 0.05) << "unit " << i;
    }
}

// ─── Whole battery ────────────────────────────────────────────────────────────

TEST(FullPipelineTest, every_test_runs_on_the_same_events) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(24, 4u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    const EventSet events(cols->x, cols->y, cols->t);
    PermutationEngine engine(4u);

    const auto classic = classic_knox(
        events, KnoxConfig{.delta = 4.0, .tau = 5.0, .permutations = 49}, engine);
    EXPECT_GE(classic.stat, 56.0);
    ASSERT_TRUE(classic.pvalue.has_value());

    const auto modified = modified_knox(
        events, ModifiedKnoxConfig{.delta = 4.0, .tau = 5.0, .permutations = 49}, engine);
    EXPECT_GT(modified.stat, 0.0);
    ASSERT_TRUE(modified.pvalue.has_value());
    EXPECT_LE(*modified.pvalue, 0.1);

    MantelConfig mantel_config;
    mantel_config.permutations = 49;
    const auto m = mantel(events, mantel_config, engine);
    EXPECT_GE(m.stat, -1.0);
    EXPECT_LE(m.stat, 1.0);
    ASSERT_TRUE(m.pvalue.has_value());

    const auto j = jacquez(events, JacquezConfig{.k = 3, .permutations = 49}, engine);
    EXPECT_LE(j.stat, static_cast<double>(events.size() * 3));
    ASSERT_TRUE(j.pvalue.has_value());
    EXPECT_LE(*j.pvalue, 0.1);
}

TEST(FullPipelineTest, reports_render) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(10, 5u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    const EventSet events(cols->x, cols->y, cols->t);
    PermutationEngine engine(5u);

    const auto local = local_knox(events,
                                  KnoxConfig{.delta = 4.0, .tau = 5.0, .permutations = 9}, engine);
    const auto text = local.to_string();
    EXPECT_NE(text.find("NST="), std::string::npos);
    EXPECT_NE(text.find("p_hypergeom"), std::string::npos);

    const auto j = jacquez(events, JacquezConfig{.k = 2, .permutations = 9}, engine);
    EXPECT_NE(j.to_string().find("stat="), std::string::npos);
}

TEST(FullPipelineTest, statistics_without_permutations_are_idempotent) {
    const auto cols = EventLoader::parse_csv_string(make_clustered_csv(20, 6u), onset_dates());
    ASSERT_TRUE(cols.has_value());
    const EventSet events(cols->x, cols->y, cols->t);

    const KnoxConfig kc{.delta = 4.0, .tau = 5.0, .permutations = 0};
    EXPECT_EQ(knox(events, kc).nst, knox(events, kc).nst);
    EXPECT_EQ(knox(events, kc).p_poisson, knox(events, kc).p_poisson);

    const ModifiedKnoxConfig mk{.delta = 4.0, .tau = 5.0, .permutations = 0};
    EXPECT_EQ(modified_knox(events, mk).stat, modified_knox(events, mk).stat);

    MantelConfig mc;
    mc.permutations = 0;
    EXPECT_EQ(mantel(events, mc).stat, mantel(events, mc).stat);

    const JacquezConfig jc{.k = 3, .permutations = 0};
    EXPECT_EQ(jacquez(events, jc).stat, jacquez(events, jc).stat);
}
