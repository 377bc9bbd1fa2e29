#ifndef REPLICATE_ANALYSIS_HPP
#define REPLICATE_ANALYSIS_HPP

#include "analysis_config.hpp"
#include "fit_result_aggregator.hpp"
#include "msd_computer.hpp"
#include "step_angle_extractor.hpp"
#include "track_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace msd_fit {

/// Everything derived from one replicate's tracks.
struct ReplicateAnalysis {
    ReplicateFitTable fit_table;
    MsdSeries ensemble;         ///< Count-weighted mean MSD over every stored track.
    StepAngleTable step_angles; ///< Empty unless config.export_step_sizes is set.
};

/**
 * @brief MSD, fit and optional step/angle extraction for every track of a store.
 *
 * Tracks are processed on num_threads OpenMP threads; outputs are assembled
 * in store order, so the result is identical for every thread count.
 * Step and angle rows are tagged with labels.condition as their group.
 */
ReplicateAnalysis
analyze_replicate(const TrackStore &store,
                  const AnalysisConfig &config,
                  const ReplicateLabels &labels,
                  int num_threads = 1);

/**
 * @brief One replicate to be analyzed by run_replicates.
 *
 * If table is set it is used directly, otherwise csv_path is read with
 * read_track_csv_file.
 */
struct ReplicateInput {
    ReplicateLabels labels;
    std::string csv_path;
    std::optional<TrackTable> table;
    bool positions_in_microns = false; ///< Skip the pixel-to-micron conversion.
};

struct ReplicateOutcome {
    ReplicateLabels labels;
    bool ok = false;
    std::string error; ///< Diagnostic including the source identity when ok is false.
    ReplicateAnalysis analysis;
};

/**
 * @brief Analyzes several replicates concurrently.
 *
 * parallelism.replicate_jobs replicates run at once, each with
 * parallelism.resolved_threads_per_replicate() threads for its track loop.
 * A schema error fails only its own replicate. Outcomes are in input order.
 * @throws std::invalid_argument if config fails validation.
 */
std::vector<ReplicateOutcome>
run_replicates(const std::vector<ReplicateInput> &inputs,
               const AnalysisConfig &config,
               const ParallelismOptions &parallelism);

} // namespace msd_fit

#endif // REPLICATE_ANALYSIS_HPP
