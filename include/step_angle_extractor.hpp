#ifndef STEP_ANGLE_EXTRACTOR_HPP
#define STEP_ANGLE_EXTRACTOR_HPP

#include "track_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace msd_fit {

/// Displacement magnitude between positions tlag apart (um).
struct StepSizeRow {
    std::string group;
    int tlag = 0;
    double step_size = 0.0;
};

/// Signed turning angle (radians, in (-pi, pi]) between successive lag-tlag displacements.
struct TurningAngleRow {
    std::string group;
    int tlag = 0;
    double angle = 0.0;
};

/**
 * @brief Long-form step-size and turning-angle tables shared by many tracks.
 *
 * Rows are appended in call order; the caller owns the table.
 */
struct StepAngleTable {
    std::vector<StepSizeRow> steps;
    std::vector<TurningAngleRow> angles;

    void append(const StepAngleTable &other);
};

/**
 * @brief Appends the step sizes and turning angles of one track for lags 1..min(max_lag, N-1).
 *
 * Uses the same position-index lag convention as compute_msd: step i at lag k
 * is |p[i+k] - p[i]|. The turning angle at lag k compares p[i+k]-p[i] with
 * p[i+2k]-p[i+k]; pairs where either displacement has zero length are skipped.
 */
void
extract_steps_and_angles(const Track &track, int max_lag, const std::string &group, StepAngleTable &table);

/**
 * @brief Non-Gaussian parameter alpha_2 = <r^4> / (3 <r^2>^2) - 1.
 *
 * Zero for a 2D Gaussian step distribution. NaN for an empty sample or when <r^2> is zero.
 */
double
non_gaussian_parameter(const std::vector<double> &step_sizes);

/// Per (group, tlag) summary of the step-size distribution.
struct StepSizeSummary {
    std::string group;
    int tlag = 0;
    std::size_t count = 0;
    double mean_step = 0.0;
    double alpha2 = 0.0;
};

/// One summary per (group, tlag), sorted by group then tlag.
std::vector<StepSizeSummary>
summarize_steps(const StepAngleTable &table);

} // namespace msd_fit

#endif // STEP_ANGLE_EXTRACTOR_HPP
