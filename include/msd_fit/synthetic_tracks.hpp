#ifndef SYNTHETIC_TRACKS_HPP
#define SYNTHETIC_TRACKS_HPP

#include "msd_computer.hpp"
#include "track_store.hpp"

#include <cstdint>
#include <vector>

namespace msd_fit {
namespace synthetic {

/**
 * @brief Straight-line track: position at sample i is (x0 + i*vx, y0 + i*vy).
 *
 * Frames run from first_frame without gaps. Units are whatever the caller
 * feeds to the track store (pixels or microns).
 */
std::vector<RawTrackRow>
constant_velocity_rows(const TrackId &id,
                       int num_samples,
                       double vx,
                       double vy,
                       double x0 = 0.0,
                       double y0 = 0.0,
                       long long first_frame = 0);

/// Immobile particle: every sample at (x, y).
std::vector<RawTrackRow>
static_rows(const TrackId &id, int num_samples, double x, double y, long long first_frame = 0);

/**
 * @brief Free 2D diffusion: Gaussian steps with per-axis variance 2 D time_step.
 *
 * Expected MSD is 4 D t. Deterministic for a given seed.
 */
std::vector<RawTrackRow>
brownian_rows(const TrackId &id, int num_samples, double D, double time_step, std::uint32_t seed);

/// Exact MSD values 4 D (lag * time_step)^alpha for lags 1..max_lag, count 1 each.
MsdSeries
power_law_series(double D, double alpha, double time_step, int max_lag);

} // namespace synthetic
} // namespace msd_fit

#endif // SYNTHETIC_TRACKS_HPP
