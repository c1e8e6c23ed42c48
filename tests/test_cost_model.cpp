#include <gtest/gtest.h>
#include <synth/cost_model.hpp>

using namespace widepath;

namespace {

TimeGrid default_grid() {
    return TimeGrid::from_rush_windows(default_rush_windows());
}

}  // namespace

// ============== RushTracker ==============

TEST(RushTracker, FollowsDefaultGrid) {
    auto windows = default_rush_windows();
    RushTracker tracker(windows);

    std::vector<bool> inside;
    for (int minute : default_grid().arrival_points) {
        inside.push_back(tracker.advance(minute) != nullptr);
    }

    //                            0      450   480   510   540   570    960   990   1020  1050  1080  1110
    std::vector<bool> expected = {false, true, true, true, true, false, true, true, true, true, true, false};
    EXPECT_EQ(inside, expected);
    EXPECT_FALSE(tracker.inside_rush());
    EXPECT_EQ(tracker.rush_index(), 2u);
}

TEST(RushTracker, ReportsActiveWindow) {
    auto windows = default_rush_windows();
    RushTracker tracker(windows);

    EXPECT_EQ(tracker.advance(0), nullptr);
    const RushWindow* morning = tracker.advance(450);
    ASSERT_NE(morning, nullptr);
    EXPECT_EQ(morning->start_minute, 450);
    EXPECT_EQ(tracker.rush_index(), 0u);

    EXPECT_EQ(tracker.advance(570), nullptr);
    EXPECT_EQ(tracker.rush_index(), 1u);

    const RushWindow* evening = tracker.advance(960);
    ASSERT_NE(evening, nullptr);
    EXPECT_EQ(evening->start_minute, 960);
}

TEST(RushTracker, SkipsWindowsTheGridNeverSamples) {
    auto windows = default_rush_windows();
    RushTracker tracker(windows);

    EXPECT_EQ(tracker.advance(0), nullptr);
    const RushWindow* active = tracker.advance(1000);
    ASSERT_NE(active, nullptr);
    EXPECT_EQ(active->start_minute, 960);
}

// ============== Multipliers ==============

TEST(RushMultiplier, RangesByPosition) {
    auto edge0 = rush_multiplier_range(0);
    auto edge4 = rush_multiplier_range(4);
    auto near1 = rush_multiplier_range(1);
    auto near3 = rush_multiplier_range(3);
    auto peak = rush_multiplier_range(2);
    ASSERT_TRUE(edge0 && edge4 && near1 && near3 && peak);

    EXPECT_DOUBLE_EQ(edge0->low, 0.10);
    EXPECT_DOUBLE_EQ(edge0->high, 0.15);
    EXPECT_DOUBLE_EQ(edge4->low, 0.10);
    EXPECT_DOUBLE_EQ(near1->low, 0.20);
    EXPECT_DOUBLE_EQ(near3->high, 0.25);
    EXPECT_DOUBLE_EQ(peak->low, 0.30);
    EXPECT_DOUBLE_EQ(peak->high, 0.40);

    EXPECT_FALSE(rush_multiplier_range(5).has_value());
    EXPECT_FALSE(rush_multiplier_range(-1).has_value());
}

// ============== Costs ==============

TEST(SynthesizeCosts, OneCostPerArrivalPoint) {
    EdgeRng rng(1);
    TimeGrid grid = default_grid();
    auto costs = synthesize_costs(10.0, grid, default_rush_windows(), rng);
    EXPECT_EQ(costs.size(), grid.size());
}

TEST(SynthesizeCosts, PiecewiseSurchargeByPosition) {
    EdgeRng rng(7);
    auto costs = synthesize_costs(10.0, default_grid(), default_rush_windows(), rng);
    ASSERT_EQ(costs.size(), 12u);

    // Outside rush: midnight and both window end points
    EXPECT_DOUBLE_EQ(costs[0], 10.0);
    EXPECT_DOUBLE_EQ(costs[5], 10.0);
    EXPECT_DOUBLE_EQ(costs[11], 10.0);

    auto in_range = [](double cost, double low, double high) {
        return cost >= 10.0 * (1.0 + low) && cost <= 10.0 * (1.0 + high);
    };

    // Morning 450, 480, 510, 540
    EXPECT_TRUE(in_range(costs[1], 0.10, 0.15)) << costs[1];
    EXPECT_TRUE(in_range(costs[2], 0.20, 0.25)) << costs[2];
    EXPECT_TRUE(in_range(costs[3], 0.30, 0.40)) << costs[3];
    EXPECT_TRUE(in_range(costs[4], 0.20, 0.25)) << costs[4];

    // Evening 960 .. 1080
    EXPECT_TRUE(in_range(costs[6], 0.10, 0.15)) << costs[6];
    EXPECT_TRUE(in_range(costs[7], 0.20, 0.25)) << costs[7];
    EXPECT_TRUE(in_range(costs[8], 0.30, 0.40)) << costs[8];
    EXPECT_TRUE(in_range(costs[9], 0.20, 0.25)) << costs[9];
    EXPECT_TRUE(in_range(costs[10], 0.10, 0.15)) << costs[10];
}

TEST(SynthesizeCosts, NeverBelowBaseCost) {
    TimeGrid grid = default_grid();
    for (uint64_t seed = 0; seed < 200; ++seed) {
        EdgeRng rng(seed);
        double base = 0.5 + static_cast<double>(seed);
        for (double cost : synthesize_costs(base, grid, default_rush_windows(), rng)) {
            EXPECT_GE(cost, base);
        }
    }
}

TEST(SynthesizeCosts, ZeroDistanceStaysZero) {
    EdgeRng rng(3);
    for (double cost : synthesize_costs(0.0, default_grid(), default_rush_windows(), rng)) {
        EXPECT_DOUBLE_EQ(cost, 0.0);
    }
}

TEST(SynthesizeCosts, SameGeneratorStateSameCosts) {
    EdgeRng a(99);
    EdgeRng b(99);
    EXPECT_EQ(synthesize_costs(4.0, default_grid(), default_rush_windows(), a),
              synthesize_costs(4.0, default_grid(), default_rush_windows(), b));
}

// ============== SpeedModel ==============

TEST(SpeedModel, DrawsWithinFactorRange) {
    SpeedModel model = SpeedModel::around(100.0);
    EdgeRng rng(5);
    for (int i = 0; i < 1000; ++i) {
        double speed = model.draw(rng);
        EXPECT_GE(speed, 80.0);
        EXPECT_LE(speed, 120.0);
    }
}

TEST(SpeedModel, MilesPerHourInKilometersPerMinute) {
    SpeedModel model = SpeedModel::mph_range_km_per_min(20.0, 25.0);
    EdgeRng rng(11);
    const double low = 20.0 * KM_PER_MILE / 60.0;
    const double high = 25.0 * KM_PER_MILE / 60.0;
    for (int i = 0; i < 1000; ++i) {
        double speed = model.draw(rng);
        EXPECT_GE(speed, low - 1e-12);
        EXPECT_LE(speed, high + 1e-12);
    }
}
