#include "msd_computer.hpp"
#include "step_angle_extractor.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <map>
#include <numbers>

using msd_fit::StepAngleTable;
using msd_fit::TrackId;
using msd_fit::TrackTable;
using namespace msd_fit::test_utils;

namespace {

msd_fit::Track
track_from_points(const std::vector<std::pair<double, double>> &points) {
    TrackTable table;
    table.source = "points";
    for (std::size_t i = 0; i < points.size(); ++i) {
        table.rows.push_back({ TrackId{ 1LL }, static_cast<long long>(i), points[i].first, points[i].second });
    }
    auto store = msd_fit::build_track_store(table, unit_scale_config(2));
    return store.tracks.at(0);
}

} // namespace

TEST(StepAngleExtractorTest, StepSizesFollowLagConvention) {
    auto const track = track_from_points({ { 0.0, 0.0 }, { 0.1, 0.0 }, { 0.2, 0.0 }, { 0.3, 0.0 }, { 0.4, 0.0 } });
    StepAngleTable table;
    msd_fit::extract_steps_and_angles(track, 10, "wt", table);

    // lags 1..4 with 4, 3, 2, 1 steps
    ASSERT_EQ(table.steps.size(), 10u);
    std::map<int, int> per_lag;
    for (const auto &row : table.steps) {
        EXPECT_EQ(row.group, "wt");
        EXPECT_NEAR(row.step_size, 0.1 * row.tlag, 1e-12);
        ++per_lag[row.tlag];
    }
    EXPECT_EQ(per_lag[1], 4);
    EXPECT_EQ(per_lag[4], 1);
}

TEST(StepAngleExtractorTest, StepCountsMatchMsdPairCounts) {
    auto const table_rows = make_table("b", { msd_fit::synthetic::brownian_rows(TrackId{ 3LL }, 25, 0.5, 0.01, 7) });
    auto const store = msd_fit::build_track_store(table_rows, unit_scale_config(11));
    const auto &track = store.tracks.at(0);

    StepAngleTable table;
    msd_fit::extract_steps_and_angles(track, 6, "ko", table);
    auto const series = msd_fit::compute_msd(track, 6);

    for (const auto &point : series) {
        std::size_t count = 0;
        double sum_sq = 0.0;
        for (const auto &row : table.steps) {
            if (row.tlag == point.lag) {
                ++count;
                sum_sq += row.step_size * row.step_size;
            }
        }
        EXPECT_EQ(count, point.count);
        EXPECT_NEAR(sum_sq / static_cast<double>(count), point.value, 1e-12);
    }
}

TEST(StepAngleExtractorTest, TurningAnglesAreSigned) {
    // right, up, right: +90 then -90 degrees
    auto const track = track_from_points({ { 0.0, 0.0 }, { 1.0, 0.0 }, { 1.0, 1.0 }, { 2.0, 1.0 } });
    StepAngleTable table;
    msd_fit::extract_steps_and_angles(track, 1, "g", table);

    ASSERT_EQ(table.angles.size(), 2u);
    EXPECT_NEAR(table.angles[0].angle, std::numbers::pi / 2.0, 1e-12);
    EXPECT_NEAR(table.angles[1].angle, -std::numbers::pi / 2.0, 1e-12);
    EXPECT_EQ(table.angles[0].tlag, 1);
}

TEST(StepAngleExtractorTest, StraightLineHasZeroAnglesAndReversalIsPi) {
    auto const line = track_from_points({ { 0.0, 0.0 }, { 1.0, 1.0 }, { 2.0, 2.0 }, { 3.0, 3.0 } });
    StepAngleTable table;
    msd_fit::extract_steps_and_angles(line, 1, "g", table);
    for (const auto &row : table.angles) { EXPECT_NEAR(row.angle, 0.0, 1e-12); }

    for (double direction : { 1.0, -1.0 }) {
        auto const back_and_forth = track_from_points({ { 0.0, 0.0 }, { direction, 0.0 }, { 0.0, 0.0 } });
        StepAngleTable reversal;
        msd_fit::extract_steps_and_angles(back_and_forth, 1, "g", reversal);
        ASSERT_EQ(reversal.angles.size(), 1u);
        EXPECT_DOUBLE_EQ(reversal.angles[0].angle, std::numbers::pi);
    }
}

TEST(StepAngleExtractorTest, ImmobileTrackHasZeroStepsAndNoAngles) {
    auto const track = track_from_points({ { 2.0, 2.0 }, { 2.0, 2.0 }, { 2.0, 2.0 } });
    StepAngleTable table;
    msd_fit::extract_steps_and_angles(track, 10, "g", table);
    EXPECT_EQ(table.steps.size(), 3u);
    for (const auto &row : table.steps) { EXPECT_EQ(row.step_size, 0.0); }
    EXPECT_TRUE(table.angles.empty());
}

TEST(StepAngleExtractorTest, NonGaussianParameter) {
    // constant step length: <r^4> = <r^2>^2
    EXPECT_NEAR(msd_fit::non_gaussian_parameter({ 1.0, 1.0, 1.0 }), 1.0 / 3.0 - 1.0, 1e-15);
    EXPECT_TRUE(std::isnan(msd_fit::non_gaussian_parameter({})));
    EXPECT_TRUE(std::isnan(msd_fit::non_gaussian_parameter({ 0.0, 0.0 })));
}

TEST(StepAngleExtractorTest, SummaryGroupsByLabelAndLag) {
    StepAngleTable table;
    table.steps = { { "wt", 1, 1.0 }, { "ko", 1, 2.0 }, { "wt", 2, 3.0 }, { "wt", 1, 3.0 } };
    StepAngleTable more;
    more.steps = { { "ko", 1, 4.0 } };
    table.append(more);

    auto const summary = msd_fit::summarize_steps(table);
    ASSERT_EQ(summary.size(), 3u);
    EXPECT_EQ(summary[0].group, "ko");
    EXPECT_EQ(summary[0].count, 2u);
    EXPECT_DOUBLE_EQ(summary[0].mean_step, 3.0);
    EXPECT_EQ(summary[1].group, "wt");
    EXPECT_EQ(summary[1].tlag, 1);
    EXPECT_DOUBLE_EQ(summary[1].mean_step, 2.0);
    EXPECT_EQ(summary[2].tlag, 2);
}
