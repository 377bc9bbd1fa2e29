#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include "analysis_config.hpp"
#include "msd_fit/synthetic_tracks.hpp"
#include "track_store.hpp"

#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace msd_fit {
namespace test_utils {

// Concatenates the rows of several synthetic tracks into one table
inline TrackTable
make_table(const std::string &source, std::initializer_list<std::vector<RawTrackRow>> tracks) {
    TrackTable table;
    table.source = source;
    for (const auto &rows : tracks) { table.rows.insert(table.rows.end(), rows.begin(), rows.end()); }
    return table;
}

// Config whose pixel scale is 1, so synthetic positions are already microns
inline AnalysisConfig
unit_scale_config(int min_track_len = 11, int tlag_cutoff = 10) {
    AnalysisConfig config;
    config.micron_per_px = 1.0;
    config.min_track_len = min_track_len;
    config.tlag_cutoff = tlag_cutoff;
    return config;
}

inline bool
contains_id(const std::vector<TrackId> &ids, const TrackId &id) {
    for (const auto &candidate : ids) {
        if (candidate == id) { return true; }
    }
    return false;
}

} // namespace test_utils
} // namespace msd_fit

#endif // TEST_UTILS_HPP
