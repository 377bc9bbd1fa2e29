#include "step_angle_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numbers>
#include <utility>

namespace msd_fit {

void
StepAngleTable::append(const StepAngleTable &other) {
    steps.insert(steps.end(), other.steps.begin(), other.steps.end());
    angles.insert(angles.end(), other.angles.begin(), other.angles.end());
}

void
extract_steps_and_angles(const Track &track, int max_lag, const std::string &group, StepAngleTable &table) {
    auto const n = static_cast<Eigen::Index>(track.size());
    if (n < 2 || max_lag < 1) { return; }

    Eigen::Index const last_lag = std::min<Eigen::Index>(max_lag, n - 1);
    for (Eigen::Index lag = 1; lag <= last_lag; ++lag) {
        Eigen::Index const pairs = n - lag;
        Eigen::VectorXd dx = track.x.tail(pairs) - track.x.head(pairs);
        Eigen::VectorXd dy = track.y.tail(pairs) - track.y.head(pairs);
        Eigen::VectorXd steps = (dx.array().square() + dy.array().square()).sqrt().matrix();

        int const tlag = static_cast<int>(lag);
        for (Eigen::Index i = 0; i < pairs; ++i) { table.steps.push_back(StepSizeRow{ group, tlag, steps(i) }); }

        // displacement i and displacement i+lag are end-to-start neighbours
        for (Eigen::Index i = 0; i + lag < pairs; ++i) {
            double const ax = dx(i);
            double const ay = dy(i);
            double const bx = dx(i + lag);
            double const by = dy(i + lag);
            if ((ax == 0.0 && ay == 0.0) || (bx == 0.0 && by == 0.0)) { continue; }
            double const cross = ax * by - ay * bx;
            double const dot = ax * bx + ay * by;
            double angle = std::atan2(cross, dot);
            if (angle <= -std::numbers::pi) { angle = std::numbers::pi; } // atan2(-0.0, x<0) gives -pi
            table.angles.push_back(TurningAngleRow{ group, tlag, angle });
        }
    }
}

double
non_gaussian_parameter(const std::vector<double> &step_sizes) {
    if (step_sizes.empty()) { return std::numeric_limits<double>::quiet_NaN(); }
    double m2 = 0.0;
    double m4 = 0.0;
    for (double r : step_sizes) {
        double const r2 = r * r;
        m2 += r2;
        m4 += r2 * r2;
    }
    m2 /= static_cast<double>(step_sizes.size());
    m4 /= static_cast<double>(step_sizes.size());
    if (m2 == 0.0) { return std::numeric_limits<double>::quiet_NaN(); }
    return m4 / (3.0 * m2 * m2) - 1.0;
}

std::vector<StepSizeSummary>
summarize_steps(const StepAngleTable &table) {
    std::map<std::pair<std::string, int>, std::vector<double>> grouped;
    for (const auto &row : table.steps) { grouped[{ row.group, row.tlag }].push_back(row.step_size); }

    std::vector<StepSizeSummary> out;
    out.reserve(grouped.size());
    for (const auto &entry : grouped) {
        const auto &values = entry.second;
        StepSizeSummary summary;
        summary.group = entry.first.first;
        summary.tlag = entry.first.second;
        summary.count = values.size();
        double sum = 0.0;
        for (double v : values) { sum += v; }
        summary.mean_step = sum / static_cast<double>(values.size());
        summary.alpha2 = non_gaussian_parameter(values);
        out.push_back(std::move(summary));
    }
    return out;
}

} // namespace msd_fit
