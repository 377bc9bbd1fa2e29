#include "curve_fitter.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace msd_fit {

std::string
to_string(FitMethod method) {
    switch (method) {
        case FitMethod::power_law:
            return "power_law";
        case FitMethod::linear:
            return "linear";
        case FitMethod::failed:
            return "failed";
    }
    return "failed";
}

FitMethod
fit_method_from_string(const std::string &name) {
    if (name == "power_law") { return FitMethod::power_law; }
    if (name == "linear") { return FitMethod::linear; }
    if (name == "failed") { return FitMethod::failed; }
    throw std::invalid_argument("Unknown fit method '" + name + "'.");
}

double
compute_r_squared(const std::vector<double> &observed, const std::vector<double> &predicted) {
    if (observed.size() != predicted.size()) {
        throw std::invalid_argument("compute_r_squared: observed and predicted differ in length.");
    }
    if (observed.empty()) { return std::numeric_limits<double>::quiet_NaN(); }

    double mean = 0.0;
    for (double v : observed) { mean += v; }
    mean /= static_cast<double>(observed.size());

    double ss_tot = 0.0;
    double ss_res = 0.0;
    for (std::size_t i = 0; i < observed.size(); ++i) {
        ss_tot += (observed[i] - mean) * (observed[i] - mean);
        ss_res += (observed[i] - predicted[i]) * (observed[i] - predicted[i]);
    }

    if (ss_tot == 0.0) { return ss_res == 0.0 ? 1.0 : -std::numeric_limits<double>::infinity(); }
    return 1.0 - ss_res / ss_tot;
}

CurveFitter::CurveFitter(const AnalysisConfig &config)
  : config_(config) {
    config_.validate();
}

void
CurveFitter::initial_guess(const std::vector<double> &times,
                           const std::vector<double> &msd,
                           double &D0,
                           double &alpha0) const {
    std::vector<std::size_t> positive;
    for (std::size_t i = 0; i < msd.size(); ++i) {
        if (msd[i] > 0.0) { positive.push_back(i); }
    }

    if (positive.size() >= 2) {
        // log MSD = log(4 D) + alpha log t
        Eigen::MatrixXd A(static_cast<Eigen::Index>(positive.size()), 2);
        Eigen::VectorXd b(static_cast<Eigen::Index>(positive.size()));
        for (std::size_t r = 0; r < positive.size(); ++r) {
            auto const row = static_cast<Eigen::Index>(r);
            A(row, 0) = 1.0;
            A(row, 1) = std::log(times[positive[r]]);
            b(row) = std::log(msd[positive[r]]);
        }
        Eigen::Vector2d coef = A.colPivHouseholderQr().solve(b);
        if (std::isfinite(coef(0)) && std::isfinite(coef(1))) {
            alpha0 = std::clamp(coef(1), config_.alpha_min_exclusive + 0.05, config_.alpha_max);
            D0 = std::exp(coef(0)) / 4.0;
            return;
        }
    }

    // Too few positive points for a log-log line: start from normal diffusion
    double st = 0.0;
    double tt = 0.0;
    for (std::size_t i = 0; i < times.size(); ++i) {
        st += times[i] * msd[i];
        tt += times[i] * times[i];
    }
    alpha0 = 1.0;
    D0 = tt > 0.0 ? std::max(st / tt, 0.0) / 4.0 : 0.0;
}

FitOutcome
CurveFitter::fit_power_law(const std::vector<double> &times, const std::vector<double> &msd) const {
    FitOutcome outcome;
    outcome.lag_points = times.size();
    if (times.size() < 2 || times.size() != msd.size()) { return outcome; }

    double D = 0.0;
    double alpha = 1.0;
    initial_guess(times, msd, D, alpha);

    ceres::Problem problem;
    for (std::size_t i = 0; i < times.size(); ++i) {
        ceres::CostFunction *cost_function = new ceres::AutoDiffCostFunction<PowerLawResidual, 1, 1, 1>(
          new PowerLawResidual(times[i], msd[i]));
        problem.AddResidualBlock(cost_function, nullptr, &D, &alpha);
    }
    problem.SetParameterLowerBound(&D, 0, 0.0);

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.max_num_iterations = config_.max_solver_iterations;
    options.function_tolerance = config_.function_tolerance;
    options.gradient_tolerance = config_.gradient_tolerance;
    options.parameter_tolerance = config_.parameter_tolerance;
    options.num_threads = 1; // tracks are already spread across threads
    options.minimizer_progress_to_stdout = false;
    options.logging_type = ceres::SILENT;

    ceres::Solver::Summary summary;
    ceres::Solve(options, &problem, &summary);
    if (config_.verbose) { std::cout << "    [CurveFitter] " << summary.BriefReport() << std::endl; }

    if (summary.termination_type != ceres::CONVERGENCE) { return outcome; }
    if (!std::isfinite(D) || !std::isfinite(alpha) || !(D > 0.0)) { return outcome; }
    if (!(alpha > config_.alpha_min_exclusive) || alpha > config_.alpha_max + config_.alpha_clamp_tolerance) {
        return outcome;
    }

    if (alpha > config_.alpha_max) {
        alpha = config_.alpha_max;
        double num = 0.0;
        double den = 0.0;
        for (std::size_t i = 0; i < times.size(); ++i) {
            double const ta = std::pow(times[i], alpha);
            num += ta * msd[i];
            den += ta * ta;
        }
        D = num / (4.0 * den);
        if (!(D > 0.0)) { return outcome; }
    }

    std::vector<double> predicted(times.size());
    for (std::size_t i = 0; i < times.size(); ++i) { predicted[i] = 4.0 * D * std::pow(times[i], alpha); }

    outcome.method = FitMethod::power_law;
    outcome.D = D;
    outcome.alpha = alpha;
    outcome.r_squared = compute_r_squared(msd, predicted);
    return outcome;
}

FitOutcome
CurveFitter::fit_linear(const std::vector<double> &times, const std::vector<double> &msd) const {
    FitOutcome outcome;
    outcome.lag_points = times.size();
    if (times.size() < 2 || times.size() != msd.size()) { return outcome; }

    double st = 0.0;
    double tt = 0.0;
    for (std::size_t i = 0; i < times.size(); ++i) {
        st += times[i] * msd[i];
        tt += times[i] * times[i];
    }
    double const slope = std::max(st / tt, 0.0);

    std::vector<double> predicted(times.size());
    for (std::size_t i = 0; i < times.size(); ++i) { predicted[i] = slope * times[i]; }

    outcome.method = FitMethod::linear;
    outcome.D = slope / 4.0;
    outcome.alpha = 1.0;
    outcome.r_squared = compute_r_squared(msd, predicted);
    return outcome;
}

FitOutcome
CurveFitter::fit(const MsdSeries &series) const {
    std::vector<double> times;
    std::vector<double> msd;
    times.reserve(series.size());
    msd.reserve(series.size());
    for (const auto &point : series) {
        if (point.lag < 1 || point.lag > config_.tlag_cutoff || point.count == 0) { continue; }
        times.push_back(static_cast<double>(point.lag) * config_.time_step);
        msd.push_back(point.value);
    }

    FitOutcome outcome;
    outcome.lag_points = times.size();
    Stage stage = Stage::power_law;
    while (stage != Stage::done) {
        switch (stage) {
            case Stage::power_law:
                outcome = fit_power_law(times, msd);
                stage = outcome.method == FitMethod::power_law ? Stage::done : Stage::linear;
                break;
            case Stage::linear:
                // fit_linear reports failed itself when fewer than two lags remain
                outcome = fit_linear(times, msd);
                stage = Stage::done;
                break;
            case Stage::done:
                break;
        }
    }
    return outcome;
}

} // namespace msd_fit
