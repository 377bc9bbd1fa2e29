#ifndef ANALYSIS_CONFIG_HPP
#define ANALYSIS_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace msd_fit {

/**
 * @brief Run-wide analysis settings.
 *
 * Constructed once per run and handed to every stage by const reference.
 * No stage keeps a copy it could mutate.
 */
struct AnalysisConfig {
    double time_step = 0.010;     ///< Seconds per frame.
    double micron_per_px = 0.11;  ///< Pixel-to-micron scale applied at ingestion.
    int min_track_len = 11;       ///< Tracks with fewer frames are excluded before fitting.
    int tlag_cutoff = 10;         ///< Largest lag (in recorded frames) used for MSD and fitting.

    // Valid range for the anomalous exponent of the power-law fit: (alpha_min_exclusive, alpha_max]
    double alpha_min_exclusive = 0.0;
    double alpha_max = 2.0;
    double alpha_clamp_tolerance = 1e-6; ///< alpha up to alpha_max + tolerance is clamped, beyond is rejected

    // Ceres solver limits
    int max_solver_iterations = 200;
    double function_tolerance = 1e-12;
    double gradient_tolerance = 1e-14;
    double parameter_tolerance = 1e-12;

    bool export_step_sizes = false; ///< Also build the step-size / turning-angle tables.
    bool verbose = false;           ///< Per-track solver reports.

    /**
     * @brief Checks the settings for consistency.
     * @throws std::invalid_argument naming the offending field.
     */
    void validate() const;
};

/**
 * @brief Two independent levels of parallelism.
 *
 * The product replicate_jobs * threads_per_replicate should not exceed the
 * available cores; resolved_threads_per_replicate() applies that default.
 */
struct ParallelismOptions {
    int replicate_jobs = 1;        ///< Replicates analyzed concurrently.
    int threads_per_replicate = 0; ///< Threads for the per-track loop, 0 = cores / replicate_jobs.

    int resolved_threads_per_replicate() const;
};

/// Labels carried alongside every derived table of one replicate.
struct ReplicateLabels {
    std::string condition;
    std::string replicate;
};

AnalysisConfig
analysis_config_from_json(const nlohmann::json &j);

nlohmann::json
analysis_config_to_json(const AnalysisConfig &config);

/**
 * @brief Reads an AnalysisConfig from a JSON file.
 *
 * Keys that are absent keep their defaults, unknown keys are ignored.
 * The result is validated before it is returned.
 * @throws std::runtime_error if the file cannot be opened or parsed.
 * @throws std::invalid_argument if a value has the wrong type or fails validation.
 */
AnalysisConfig
load_analysis_config(const std::string &path);

/**
 * @brief Writes the parameters a replicate was analyzed with as pretty-printed JSON.
 */
void
write_params_log(const std::string &path, const AnalysisConfig &config, const ReplicateLabels &labels);

} // namespace msd_fit

#endif // ANALYSIS_CONFIG_HPP
