#include "msd_fit/synthetic_tracks.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace msd_fit {
namespace synthetic {

std::vector<RawTrackRow>
constant_velocity_rows(const TrackId &id,
                       int num_samples,
                       double vx,
                       double vy,
                       double x0,
                       double y0,
                       long long first_frame) {
    std::vector<RawTrackRow> rows;
    rows.reserve(static_cast<std::size_t>(std::max(0, num_samples)));
    for (int i = 0; i < num_samples; ++i) {
        rows.push_back(RawTrackRow{ id, first_frame + i, x0 + i * vx, y0 + i * vy });
    }
    return rows;
}

std::vector<RawTrackRow>
static_rows(const TrackId &id, int num_samples, double x, double y, long long first_frame) {
    return constant_velocity_rows(id, num_samples, 0.0, 0.0, x, y, first_frame);
}

std::vector<RawTrackRow>
brownian_rows(const TrackId &id, int num_samples, double D, double time_step, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> step(0.0, std::sqrt(2.0 * D * time_step));

    std::vector<RawTrackRow> rows;
    rows.reserve(static_cast<std::size_t>(std::max(0, num_samples)));
    double x = 0.0;
    double y = 0.0;
    for (int i = 0; i < num_samples; ++i) {
        rows.push_back(RawTrackRow{ id, i, x, y });
        x += step(gen);
        y += step(gen);
    }
    return rows;
}

MsdSeries
power_law_series(double D, double alpha, double time_step, int max_lag) {
    MsdSeries series;
    for (int lag = 1; lag <= max_lag; ++lag) {
        series.push_back(MsdPoint{ lag, 4.0 * D * std::pow(lag * time_step, alpha), 1 });
    }
    return series;
}

} // namespace synthetic
} // namespace msd_fit
