#ifndef MSD_COMPUTER_HPP
#define MSD_COMPUTER_HPP

#include "track_store.hpp"

#include <Eigen/Core>
#include <cstddef>
#include <vector>

namespace msd_fit {

/// MSD at one lag; lag counts recorded positions, not frame numbers.
struct MsdPoint {
    int lag = 0;
    double value = 0.0;     ///< Mean squared displacement in um^2.
    std::size_t count = 0;  ///< Number of displacement pairs averaged.
};

/// Ordered by lag, only lags with count > 0 are present.
using MsdSeries = std::vector<MsdPoint>;

/**
 * @brief MSD of a position sequence for lags 1..min(max_lag, N-1).
 *
 * Pairs are formed by position within the sequence: lag k compares sample i
 * with sample i+k, whatever their frame numbers. Each lag is evaluated as one
 * vectorized head/tail difference over the whole track.
 *
 * Pure function of its inputs. Returns an empty series for fewer than 2 samples.
 */
MsdSeries
compute_msd(const Eigen::Ref<const Eigen::VectorXd> &x, const Eigen::Ref<const Eigen::VectorXd> &y, int max_lag);

MsdSeries
compute_msd(const Track &track, int max_lag);

/**
 * @brief compute_msd for every track, output index i belongs to tracks[i].
 *
 * The loop over tracks runs on num_threads OpenMP threads; the result does
 * not depend on the thread count.
 */
std::vector<MsdSeries>
compute_msd_batch(const std::vector<Track> &tracks, int max_lag, int num_threads = 1);

/**
 * @brief Count-weighted mean of several MSD series, per lag.
 *
 * Each lag's value is sum(value * count) / sum(count) over the series that
 * contain the lag.
 */
MsdSeries
ensemble_msd(const std::vector<MsdSeries> &series);

} // namespace msd_fit

#endif // MSD_COMPUTER_HPP
