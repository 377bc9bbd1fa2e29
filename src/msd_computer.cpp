#include "msd_computer.hpp"

#include <algorithm>
#include <map>

namespace msd_fit {

MsdSeries
compute_msd(const Eigen::Ref<const Eigen::VectorXd> &x, const Eigen::Ref<const Eigen::VectorXd> &y, int max_lag) {
    MsdSeries series;
    Eigen::Index const n = std::min(x.size(), y.size());
    if (n < 2 || max_lag < 1) { return series; }

    Eigen::Index const last_lag = std::min<Eigen::Index>(max_lag, n - 1);
    series.reserve(static_cast<std::size_t>(last_lag));
    for (Eigen::Index lag = 1; lag <= last_lag; ++lag) {
        Eigen::Index const pairs = n - lag;
        auto dx = x.tail(pairs).array() - x.head(pairs).array();
        auto dy = y.tail(pairs).array() - y.head(pairs).array();
        double const sum_sq = (dx.square() + dy.square()).sum();

        MsdPoint point;
        point.lag = static_cast<int>(lag);
        point.count = static_cast<std::size_t>(pairs);
        point.value = sum_sq / static_cast<double>(pairs);
        series.push_back(point);
    }
    return series;
}

MsdSeries
compute_msd(const Track &track, int max_lag) {
    return compute_msd(track.x, track.y, max_lag);
}

std::vector<MsdSeries>
compute_msd_batch(const std::vector<Track> &tracks, int max_lag, int num_threads) {
    std::vector<MsdSeries> results(tracks.size());
    auto const n = static_cast<long long>(tracks.size());

#pragma omp parallel for schedule(dynamic, 64) num_threads(std::max(1, num_threads))
    for (long long i = 0; i < n; ++i) {
        results[static_cast<std::size_t>(i)] = compute_msd(tracks[static_cast<std::size_t>(i)], max_lag);
    }
    return results;
}

MsdSeries
ensemble_msd(const std::vector<MsdSeries> &series) {
    std::map<int, std::pair<double, std::size_t>> accum; // lag -> (weighted sum, count)
    for (const auto &s : series) {
        for (const auto &point : s) {
            auto &slot = accum[point.lag];
            slot.first += point.value * static_cast<double>(point.count);
            slot.second += point.count;
        }
    }

    MsdSeries out;
    out.reserve(accum.size());
    for (const auto &entry : accum) {
        if (entry.second.second == 0) { continue; }
        out.push_back(
          MsdPoint{ entry.first, entry.second.first / static_cast<double>(entry.second.second), entry.second.second });
    }
    return out;
}

} // namespace msd_fit
