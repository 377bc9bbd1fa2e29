#ifndef FIT_RESULT_AGGREGATOR_HPP
#define FIT_RESULT_AGGREGATOR_HPP

#include "analysis_config.hpp"
#include "curve_fitter.hpp"
#include "step_angle_extractor.hpp"
#include "track_store.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace msd_fit {

/// One fitted track. Holds labels, not a reference to the Track.
struct FitResult {
    TrackId track_id;
    std::string condition;
    std::string replicate;
    double D_fit = 0.0;
    double alpha_fit = 0.0;
    double r2_fit = 0.0;
    FitMethod fit_method = FitMethod::failed;
};

/**
 * @brief Diagnostic counters of one replicate.
 *
 * input_tracks == excluded_short + fitted + failed.
 */
struct ReplicateCounts {
    std::size_t input_tracks = 0;
    std::size_t excluded_short = 0;
    std::size_t fitted = 0;
    std::size_t failed = 0;
    std::size_t power_law = 0;
    std::size_t linear = 0;
    std::size_t duplicate_rows_dropped = 0;
};

/// Aggregated table of one replicate; failed tracks are listed by id only.
struct ReplicateFitTable {
    ReplicateLabels labels;
    std::vector<FitResult> rows;
    std::vector<TrackId> failed_tracks;
    ReplicateCounts counts;
};

/**
 * @brief Collects per-track fit outcomes of one replicate into a ReplicateFitTable.
 *
 * Outcomes must be added in the order the table should have; failed outcomes
 * are counted and listed but never become rows.
 */
class FitResultAggregator {
  public:
    explicit FitResultAggregator(ReplicateLabels labels);

    /// Copies the ingestion counters (input tracks, short tracks, duplicates).
    void record_ingestion(const TrackStore &store);

    void add(const TrackId &track_id, const FitOutcome &outcome);

    const ReplicateFitTable &table() const { return table_; }

    ReplicateFitTable release();

  private:
    ReplicateFitTable table_;
};

/**
 * @brief Writes rows as CSV with header track_id,condition,replicate,D_fit,alpha_fit,r2_fit,fit_method.
 *
 * Numbers are written with max_digits10 precision so identical tables give identical bytes.
 */
void
write_fit_results_csv(std::ostream &out, const ReplicateFitTable &table);

/// Tab-separated group, tlag, step_size.
void
write_step_table_tsv(std::ostream &out, const StepAngleTable &table);

/// Tab-separated group, tlag, angle.
void
write_angle_table_tsv(std::ostream &out, const StepAngleTable &table);

} // namespace msd_fit

#endif // FIT_RESULT_AGGREGATOR_HPP
