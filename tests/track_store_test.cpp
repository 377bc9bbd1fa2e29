#include "test_utils.hpp"
#include "track_store.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using msd_fit::InputSchemaError;
using msd_fit::RawTrackRow;
using msd_fit::TrackId;
using msd_fit::TrackTable;
using namespace msd_fit::test_utils;

TEST(TrackStoreTest, GroupsSortsAndConvertsToMicrons) {
    TrackTable table;
    table.source = "unit";
    table.rows = { { TrackId{ 7LL }, 2, 4.0, 6.0 }, { TrackId{ 7LL }, 0, 0.0, 2.0 }, { TrackId{ 7LL }, 1, 2.0, 4.0 } };

    msd_fit::AnalysisConfig config;
    config.micron_per_px = 0.5;
    config.min_track_len = 3;

    auto const store = msd_fit::build_track_store(table, config);
    ASSERT_EQ(store.tracks.size(), 1u);
    const auto &track = store.tracks[0];
    EXPECT_EQ(track.id, TrackId{ 7LL });
    ASSERT_EQ(track.frames, (std::vector<long long>{ 0, 1, 2 }));
    EXPECT_DOUBLE_EQ(track.x(0), 0.0);
    EXPECT_DOUBLE_EQ(track.x(1), 1.0);
    EXPECT_DOUBLE_EQ(track.x(2), 2.0);
    EXPECT_DOUBLE_EQ(track.y(0), 1.0);
    EXPECT_DOUBLE_EQ(track.y(2), 3.0);
}

TEST(TrackStoreTest, MicronInputIsNotRescaled) {
    auto const table = make_table("unit", { msd_fit::synthetic::constant_velocity_rows(TrackId{ 1LL }, 4, 0.1, 0.0) });
    msd_fit::AnalysisConfig config;
    config.min_track_len = 4;
    auto const store = msd_fit::build_track_store_from_microns(table, config);
    ASSERT_EQ(store.tracks.size(), 1u);
    EXPECT_DOUBLE_EQ(store.tracks[0].x(3), 3 * 0.1);
}

TEST(TrackStoreTest, DuplicateFramesKeepFirstOccurrence) {
    TrackTable table;
    table.source = "dups";
    table.rows = { { TrackId{ 1LL }, 0, 0.0, 0.0 },
                   { TrackId{ 1LL }, 1, 1.0, 0.0 },
                   { TrackId{ 1LL }, 1, 9.0, 9.0 },
                   { TrackId{ 1LL }, 2, 2.0, 0.0 } };

    auto const store = msd_fit::build_track_store(table, unit_scale_config(3));
    EXPECT_EQ(store.duplicate_rows_dropped, 1u);
    ASSERT_EQ(store.tracks.size(), 1u);
    ASSERT_EQ(store.tracks[0].size(), 3u);
    EXPECT_DOUBLE_EQ(store.tracks[0].x(1), 1.0);
    EXPECT_DOUBLE_EQ(store.tracks[0].y(1), 0.0);
}

TEST(TrackStoreTest, ShortTracksAreExcludedAndCounted) {
    auto const table = make_table("short",
                                  { msd_fit::synthetic::static_rows(TrackId{ 1LL }, 11, 0.0, 0.0),
                                    msd_fit::synthetic::static_rows(TrackId{ 2LL }, 10, 0.0, 0.0),
                                    msd_fit::synthetic::static_rows(TrackId{ std::string("a") }, 2, 0.0, 0.0) });

    auto const store = msd_fit::build_track_store(table, unit_scale_config(11));
    EXPECT_EQ(store.input_tracks, 3u);
    EXPECT_EQ(store.excluded_short_tracks, 2u);
    ASSERT_EQ(store.tracks.size(), 1u);
    EXPECT_EQ(store.tracks[0].id, TrackId{ 1LL });
}

TEST(TrackStoreTest, IntegerIdsOrderBeforeStringIds) {
    auto const table = make_table("mixed",
                                  { msd_fit::synthetic::static_rows(TrackId{ std::string("b") }, 2, 0.0, 0.0),
                                    msd_fit::synthetic::static_rows(TrackId{ 10LL }, 2, 0.0, 0.0),
                                    msd_fit::synthetic::static_rows(TrackId{ std::string("a") }, 2, 0.0, 0.0),
                                    msd_fit::synthetic::static_rows(TrackId{ 2LL }, 2, 0.0, 0.0) });

    auto const store = msd_fit::build_track_store(table, unit_scale_config(2));
    ASSERT_EQ(store.tracks.size(), 4u);
    EXPECT_EQ(store.tracks[0].id, TrackId{ 2LL });
    EXPECT_EQ(store.tracks[1].id, TrackId{ 10LL });
    EXPECT_EQ(store.tracks[2].id, TrackId{ std::string("a") });
    EXPECT_EQ(store.tracks[3].id, TrackId{ std::string("b") });
    EXPECT_EQ(msd_fit::to_string(store.tracks[1].id), "10");
}

TEST(TrackCsvTest, ReadsAliasedColumnsAndMixedIds) {
    std::istringstream in("Trajectory,Frame,x,y,intensity\n"
                          "1,0,1.5,2.5,100\n"
                          "1,1.0,1.6,2.4,101\n"
                          "\n"
                          "cell_a,0,3,4,90\n");
    TrackTable const table = msd_fit::read_track_csv(in, "Traj_wt_1.csv");
    EXPECT_EQ(table.source, "Traj_wt_1.csv");
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_EQ(table.rows[0].track_id, TrackId{ 1LL });
    EXPECT_EQ(table.rows[1].frame, 1);
    EXPECT_DOUBLE_EQ(table.rows[1].x, 1.6);
    EXPECT_EQ(table.rows[2].track_id, TrackId{ std::string("cell_a") });
    EXPECT_DOUBLE_EQ(table.rows[2].y, 4.0);
}

TEST(TrackCsvTest, MissingColumnIsSchemaErrorNamingTheSource) {
    std::istringstream in("track_id,frame,x\n1,0,1.0\n");
    try {
        msd_fit::read_track_csv(in, "Traj_ko_2.csv");
        FAIL() << "Expected InputSchemaError";
    } catch (const InputSchemaError &e) {
        std::string const what = e.what();
        EXPECT_NE(what.find("Traj_ko_2.csv"), std::string::npos);
        EXPECT_NE(what.find("y"), std::string::npos);
        EXPECT_EQ(e.source(), "Traj_ko_2.csv");
    }
}

TEST(TrackCsvTest, FrameOutsideIntegerRangeIsSchemaError) {
    for (const char *frame : { "1e19", "-1e300", "9223372036854775808" }) {
        std::istringstream in(std::string("track_id,frame,x,y\n1,") + frame + ",1.0,2.0\n");
        EXPECT_THROW(msd_fit::read_track_csv(in, "range.csv"), InputSchemaError) << frame;
    }

    std::istringstream ok("track_id,frame,x,y\n1,12.0,1.0,2.0\n1,-3,1.0,2.0\n");
    auto const table = msd_fit::read_track_csv(ok, "range.csv");
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0].frame, 12);
    EXPECT_EQ(table.rows[1].frame, -3);
}

TEST(TrackCsvTest, QuotedFieldsKeepSeparatorsAndQuotes) {
    std::istringstream in("track_id,frame,x,y\n"
                          "\"cell, \"\"a\"\"\",0,\"1.5\",2.5\n");
    auto const table = msd_fit::read_track_csv(in, "quoted.csv");
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0].track_id, TrackId{ std::string("cell, \"a\"") });
    EXPECT_DOUBLE_EQ(table.rows[0].x, 1.5);
}

TEST(TrackCsvTest, BlankOrNonNumericFieldsAreSchemaErrors) {
    std::istringstream blank("track_id,frame,x,y\n1,0,,2.0\n");
    EXPECT_THROW(msd_fit::read_track_csv(blank, "blank.csv"), InputSchemaError);

    std::istringstream text("track_id,frame,x,y\n1,zero,1.0,2.0\n");
    EXPECT_THROW(msd_fit::read_track_csv(text, "text.csv"), InputSchemaError);

    std::istringstream short_line("track_id,frame,x,y\n1,0,1.0\n");
    EXPECT_THROW(msd_fit::read_track_csv(short_line, "short.csv"), InputSchemaError);

    std::istringstream empty("");
    EXPECT_THROW(msd_fit::read_track_csv(empty, "empty.csv"), InputSchemaError);

    EXPECT_THROW(msd_fit::read_track_csv_file("/nonexistent/dir/Traj_none_1.csv"), InputSchemaError);
}

TEST(TrackStoreTest, ResampleFillsMissingFramesLinearly) {
    TrackTable table;
    table.source = "gap";
    table.rows = { { TrackId{ 1LL }, 0, 0.0, 0.0 }, { TrackId{ 1LL }, 1, 1.0, 2.0 }, { TrackId{ 1LL }, 4, 4.0, 8.0 } };
    auto const store = msd_fit::build_track_store(table, unit_scale_config(3));
    ASSERT_EQ(store.tracks.size(), 1u);

    auto const regular = msd_fit::resample_to_regular_grid(store.tracks[0]);
    ASSERT_EQ(regular.frames, (std::vector<long long>{ 0, 1, 2, 3, 4 }));
    EXPECT_DOUBLE_EQ(regular.x(2), 2.0);
    EXPECT_DOUBLE_EQ(regular.x(3), 3.0);
    EXPECT_DOUBLE_EQ(regular.y(2), 4.0);
    EXPECT_DOUBLE_EQ(regular.y(4), 8.0);

    auto const unchanged = msd_fit::resample_to_regular_grid(regular);
    EXPECT_EQ(unchanged.frames, regular.frames);
}
