#include "track_store.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <utility>

namespace msd_fit {

std::string
to_string(const TrackId &id) {
    if (const auto *num = std::get_if<long long>(&id)) { return std::to_string(*num); }
    return std::get<std::string>(id);
}

std::ostream &
operator<<(std::ostream &os, const TrackId &id) {
    return os << to_string(id);
}

namespace {

std::string
trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) { return ""; }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string>
split_csv_line(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char const c = line[i];
        if (c == '"') {
            // "" inside a quoted field is a literal quote
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == ',' && !in_quotes) {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(trim(field));
    return fields;
}

std::optional<std::size_t>
find_column(const std::vector<std::string> &header, std::initializer_list<const char *> aliases) {
    for (const char *alias : aliases) {
        auto it = std::find(header.begin(), header.end(), alias);
        if (it != header.end()) { return static_cast<std::size_t>(it - header.begin()); }
    }
    return std::nullopt;
}

std::optional<long long>
parse_integer(const std::string &s) {
    if (s.empty()) { return std::nullopt; }
    try {
        std::size_t used = 0;
        long long value = std::stoll(s, &used);
        if (used == s.size()) { return value; }
        // Frame columns written by float-typed exporters ("12.0")
        double d = std::stod(s, &used);
        // 2^63 is exact as a double; anything outside [-2^63, 2^63) does not fit a long long
        double const limit = -static_cast<double>(std::numeric_limits<long long>::min());
        if (used == s.size() && std::isfinite(d) && d == std::floor(d) && d >= -limit && d < limit) {
            return static_cast<long long>(d);
        }
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double>
parse_real(const std::string &s) {
    if (s.empty()) { return std::nullopt; }
    try {
        std::size_t used = 0;
        double value = std::stod(s, &used);
        if (used == s.size() && std::isfinite(value)) { return value; }
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return std::nullopt;
}

TrackStore
group_rows(const TrackTable &table, const AnalysisConfig &config, double scale) {
    config.validate();

    // Inner map keyed by frame: emplace keeps the first occurrence of a duplicate frame.
    std::map<TrackId, std::map<long long, std::pair<double, double>>> grouped;
    TrackStore store;
    for (const auto &row : table.rows) {
        auto &samples = grouped[row.track_id];
        if (!samples.emplace(row.frame, std::make_pair(row.x * scale, row.y * scale)).second) {
            ++store.duplicate_rows_dropped;
        }
    }

    store.input_tracks = grouped.size();
    store.tracks.reserve(grouped.size());
    for (auto &entry : grouped) {
        const auto &samples = entry.second;
        if (samples.size() < static_cast<std::size_t>(config.min_track_len)) {
            ++store.excluded_short_tracks;
            continue;
        }
        Track track;
        track.id = entry.first;
        track.frames.reserve(samples.size());
        track.x.resize(static_cast<Eigen::Index>(samples.size()));
        track.y.resize(static_cast<Eigen::Index>(samples.size()));
        Eigen::Index i = 0;
        for (const auto &sample : samples) {
            track.frames.push_back(sample.first);
            track.x(i) = sample.second.first;
            track.y(i) = sample.second.second;
            ++i;
        }
        store.tracks.push_back(std::move(track));
    }

    if (store.duplicate_rows_dropped > 0) {
        std::cerr << "[TrackStore] Warning: " << table.source << ": dropped " << store.duplicate_rows_dropped
                  << " duplicate (track_id, frame) row(s), first occurrence kept." << std::endl;
    }
    std::cout << "[TrackStore] " << table.source << ": " << store.input_tracks << " track(s), "
              << store.excluded_short_tracks << " shorter than " << config.min_track_len << " frames, "
              << store.tracks.size() << " kept." << std::endl;
    return store;
}

} // namespace

TrackTable
read_track_csv(std::istream &in, const std::string &source) {
    TrackTable table;
    table.source = source;

    std::string line;
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            header = split_csv_line(line);
            break;
        }
    }
    if (header.empty()) { throw InputSchemaError(source, "Input is empty, no header row found."); }

    auto id_col = find_column(header, { "track_id", "Trajectory", "TRACK_ID" });
    auto frame_col = find_column(header, { "frame", "Frame", "FRAME" });
    auto x_col = find_column(header, { "x", "X", "POSITION_X" });
    auto y_col = find_column(header, { "y", "Y", "POSITION_Y" });

    std::vector<std::string> missing;
    if (!id_col) { missing.emplace_back("track_id"); }
    if (!frame_col) { missing.emplace_back("frame"); }
    if (!x_col) { missing.emplace_back("x"); }
    if (!y_col) { missing.emplace_back("y"); }
    if (!missing.empty()) {
        std::string names;
        for (const auto &m : missing) { names += (names.empty() ? "" : ", ") + m; }
        throw InputSchemaError(source, "Missing required column(s): " + names + ".");
    }

    std::size_t const needed = std::max({ *id_col, *frame_col, *x_col, *y_col }) + 1;
    std::size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (trim(line).empty()) { continue; }
        auto fields = split_csv_line(line);
        if (fields.size() < needed) {
            throw InputSchemaError(source, "Line " + std::to_string(line_number) + " has " +
                                             std::to_string(fields.size()) + " field(s), expected at least " +
                                             std::to_string(needed) + ".");
        }

        const std::string &id_field = fields[*id_col];
        if (id_field.empty()) {
            throw InputSchemaError(source, "Line " + std::to_string(line_number) + ": blank track id.");
        }
        auto frame = parse_integer(fields[*frame_col]);
        auto x = parse_real(fields[*x_col]);
        auto y = parse_real(fields[*y_col]);
        if (!frame || !x || !y) {
            throw InputSchemaError(source, "Line " + std::to_string(line_number) +
                                             ": frame, x or y is blank or not numeric.");
        }

        RawTrackRow row;
        if (auto numeric_id = parse_integer(id_field); numeric_id && id_field.find('.') == std::string::npos) {
            row.track_id = *numeric_id;
        } else {
            row.track_id = id_field;
        }
        row.frame = *frame;
        row.x = *x;
        row.y = *y;
        table.rows.push_back(std::move(row));
    }
    return table;
}

TrackTable
read_track_csv_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) { throw InputSchemaError(path, "Could not open file."); }
    return read_track_csv(in, path);
}

TrackStore
build_track_store(const TrackTable &table, const AnalysisConfig &config) {
    return group_rows(table, config, config.micron_per_px);
}

TrackStore
build_track_store_from_microns(const TrackTable &table, const AnalysisConfig &config) {
    return group_rows(table, config, 1.0);
}

Track
resample_to_regular_grid(const Track &track) {
    if (track.size() < 2) { return track; }
    long long const first = track.frames.front();
    long long const last = track.frames.back();
    auto const span = static_cast<std::size_t>(last - first + 1);
    if (span == track.size()) { return track; }

    Track out;
    out.id = track.id;
    out.frames.resize(span);
    out.x.resize(static_cast<Eigen::Index>(span));
    out.y.resize(static_cast<Eigen::Index>(span));

    std::size_t k = 0; // index of the recorded sample at or before the current frame
    for (std::size_t i = 0; i < span; ++i) {
        long long const frame = first + static_cast<long long>(i);
        while (k + 1 < track.size() && track.frames[k + 1] <= frame) { ++k; }
        auto const idx = static_cast<Eigen::Index>(i);
        out.frames[i] = frame;
        if (track.frames[k] == frame) {
            out.x(idx) = track.x(static_cast<Eigen::Index>(k));
            out.y(idx) = track.y(static_cast<Eigen::Index>(k));
        } else {
            auto const lo = static_cast<Eigen::Index>(k);
            double const w = static_cast<double>(frame - track.frames[k]) /
                             static_cast<double>(track.frames[k + 1] - track.frames[k]);
            out.x(idx) = (1.0 - w) * track.x(lo) + w * track.x(lo + 1);
            out.y(idx) = (1.0 - w) * track.y(lo) + w * track.y(lo + 1);
        }
    }
    return out;
}

} // namespace msd_fit
