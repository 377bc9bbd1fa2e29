#ifndef TRACK_STORE_HPP
#define TRACK_STORE_HPP

#include "analysis_config.hpp"

#include <Eigen/Core>
#include <cstddef>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace msd_fit {

/**
 * @brief Track identifier as it appears in the source table.
 *
 * Either an integer or a string label. std::variant ordering places every
 * integer id before every string id, then compares by value.
 */
using TrackId = std::variant<long long, std::string>;

std::string
to_string(const TrackId &id);

std::ostream &
operator<<(std::ostream &os, const TrackId &id);

/// One source row; x and y are in pixels unless stated otherwise by the caller.
struct RawTrackRow {
    TrackId track_id;
    long long frame = 0;
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Rows of one replicate together with the identity of their source.
 */
struct TrackTable {
    std::string source; ///< File name or other identity used in diagnostics.
    std::vector<RawTrackRow> rows;
};

/**
 * @brief Thrown when a source table does not match the expected schema.
 *
 * Always fatal to the replicate the table belongs to.
 */
class InputSchemaError : public std::runtime_error {
  public:
    InputSchemaError(const std::string &source, const std::string &message)
      : std::runtime_error("[" + source + "] " + message)
      , source_(source) {}

    const std::string &source() const { return source_; }

  private:
    std::string source_;
};

/**
 * @brief A single trajectory ordered by frame, positions in micrometers.
 *
 * frames is strictly increasing but may have gaps. x and y have the same
 * length as frames.
 */
struct Track {
    TrackId id;
    std::vector<long long> frames;
    Eigen::VectorXd x;
    Eigen::VectorXd y;

    std::size_t size() const { return frames.size(); }
};

/**
 * @brief The normalized tracks of one replicate plus ingestion counters.
 *
 * tracks is sorted by id, so every downstream table inherits a deterministic order.
 */
struct TrackStore {
    std::vector<Track> tracks;
    std::size_t input_tracks = 0;           ///< Distinct ids seen in the input.
    std::size_t excluded_short_tracks = 0;  ///< Ids dropped for having fewer than min_track_len frames.
    std::size_t duplicate_rows_dropped = 0; ///< Repeated (track_id, frame) rows, first occurrence kept.
};

/**
 * @brief Parses a header-driven CSV trajectory table.
 *
 * Recognized column names (first match wins):
 *   track id: track_id, Trajectory, TRACK_ID
 *   frame:    frame, Frame, FRAME
 *   x:        x, X, POSITION_X
 *   y:        y, Y, POSITION_Y
 * Other columns are ignored. Track ids that parse as integers are stored as
 * integers, everything else as strings.
 *
 * @throws InputSchemaError if the header is missing, a required column is
 *         absent, or a required field is blank or unparsable.
 */
TrackTable
read_track_csv(std::istream &in, const std::string &source);

/// Opens path and forwards to read_track_csv; an unreadable file is a schema error.
TrackTable
read_track_csv_file(const std::string &path);

/**
 * @brief Groups rows into tracks, converts pixels to micrometers and drops short tracks.
 *
 * Duplicate (track_id, frame) rows keep the first occurrence in input order;
 * later ones are counted in duplicate_rows_dropped and otherwise ignored.
 */
TrackStore
build_track_store(const TrackTable &table, const AnalysisConfig &config);

/// Same as build_track_store for rows whose x, y are already in micrometers.
TrackStore
build_track_store_from_microns(const TrackTable &table, const AnalysisConfig &config);

/**
 * @brief Fills missing frames by linear interpolation between recorded neighbours.
 *
 * After resampling, a lag of k positions equals k frames of elapsed time.
 * Tracks without gaps are returned unchanged.
 */
Track
resample_to_regular_grid(const Track &track);

} // namespace msd_fit

#endif // TRACK_STORE_HPP
