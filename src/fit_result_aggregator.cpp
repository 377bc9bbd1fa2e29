#include "fit_result_aggregator.hpp"

#include <limits>
#include <ostream>
#include <string>
#include <utility>

namespace msd_fit {

namespace {

// RFC 4180 quoting: fields holding a separator, quote or line break are quoted, quotes doubled
std::string
csv_field(const std::string &value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) { return value; }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') { out.push_back('"'); }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

FitResultAggregator::FitResultAggregator(ReplicateLabels labels) {
    table_.labels = std::move(labels);
}

void
FitResultAggregator::record_ingestion(const TrackStore &store) {
    table_.counts.input_tracks = store.input_tracks;
    table_.counts.excluded_short = store.excluded_short_tracks;
    table_.counts.duplicate_rows_dropped = store.duplicate_rows_dropped;
}

void
FitResultAggregator::add(const TrackId &track_id, const FitOutcome &outcome) {
    switch (outcome.method) {
        case FitMethod::failed:
            ++table_.counts.failed;
            table_.failed_tracks.push_back(track_id);
            return;
        case FitMethod::power_law:
            ++table_.counts.power_law;
            break;
        case FitMethod::linear:
            ++table_.counts.linear;
            break;
    }
    ++table_.counts.fitted;

    FitResult row;
    row.track_id = track_id;
    row.condition = table_.labels.condition;
    row.replicate = table_.labels.replicate;
    row.D_fit = outcome.D;
    row.alpha_fit = outcome.alpha;
    row.r2_fit = outcome.r_squared;
    row.fit_method = outcome.method;
    table_.rows.push_back(std::move(row));
}

ReplicateFitTable
FitResultAggregator::release() {
    return std::move(table_);
}

void
write_fit_results_csv(std::ostream &out, const ReplicateFitTable &table) {
    auto const old_precision = out.precision(std::numeric_limits<double>::max_digits10);
    out << "track_id,condition,replicate,D_fit,alpha_fit,r2_fit,fit_method\n";
    for (const auto &row : table.rows) {
        out << csv_field(to_string(row.track_id)) << ',' << csv_field(row.condition) << ','
            << csv_field(row.replicate) << ',' << row.D_fit << ','
            << row.alpha_fit << ',' << row.r2_fit << ',' << to_string(row.fit_method) << '\n';
    }
    out.precision(old_precision);
}

void
write_step_table_tsv(std::ostream &out, const StepAngleTable &table) {
    auto const old_precision = out.precision(std::numeric_limits<double>::max_digits10);
    out << "group\ttlag\tstep_size\n";
    for (const auto &row : table.steps) { out << row.group << '\t' << row.tlag << '\t' << row.step_size << '\n'; }
    out.precision(old_precision);
}

void
write_angle_table_tsv(std::ostream &out, const StepAngleTable &table) {
    auto const old_precision = out.precision(std::numeric_limits<double>::max_digits10);
    out << "group\ttlag\tangle\n";
    for (const auto &row : table.angles) { out << row.group << '\t' << row.tlag << '\t' << row.angle << '\n'; }
    out.precision(old_precision);
}

} // namespace msd_fit
