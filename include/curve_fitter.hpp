#ifndef CURVE_FITTER_HPP
#define CURVE_FITTER_HPP

#include "analysis_config.hpp"
#include "msd_computer.hpp"

#include <ceres/ceres.h>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace msd_fit {

enum class FitMethod { power_law, linear, failed };

std::string
to_string(FitMethod method);

/// @throws std::invalid_argument for an unknown name.
FitMethod
fit_method_from_string(const std::string &name);

/**
 * @brief Result of one fit attempt on one MSD series.
 *
 * power_law: D and alpha from the nonlinear fit.
 * linear:    alpha == 1, D from the closed-form slope.
 * failed:    D, alpha and r_squared are NaN, lag_points < 2.
 */
struct FitOutcome {
    FitMethod method = FitMethod::failed;
    double D = std::numeric_limits<double>::quiet_NaN();
    double alpha = std::numeric_limits<double>::quiet_NaN();
    double r_squared = std::numeric_limits<double>::quiet_NaN();
    std::size_t lag_points = 0; ///< Lags that took part in the fit and in R^2.
};

/**
 * @brief Coefficient of determination of predicted against observed.
 *
 * When the observations have zero variance, returns 1.0 if every residual is
 * zero and -infinity otherwise, never NaN.
 */
double
compute_r_squared(const std::vector<double> &observed, const std::vector<double> &predicted);

/**
 * @brief Fits MSD(t) = 4 D t^alpha to an MSD series, t = lag * time_step.
 *
 * The attempt runs as a three-state chain:
 *   power law  -- converged, D > 0, alpha in range --> power_law
 *              -- otherwise --------------------------> linear
 *   linear     -- at least 2 lag points --------------> linear
 *              -- otherwise --------------------------> failed
 */
class CurveFitter {
  public:
    explicit CurveFitter(const AnalysisConfig &config);

    FitOutcome fit(const MsdSeries &series) const;

    /**
     * @brief Nonlinear power-law fit alone; method is failed when the fit is rejected.
     *
     * Accepted when Ceres reports CONVERGENCE and the parameters satisfy
     * D > 0 and alpha_min_exclusive < alpha <= alpha_max + alpha_clamp_tolerance.
     * alpha within the clamp tolerance above alpha_max is set to alpha_max and
     * D is refit at that exponent.
     */
    FitOutcome fit_power_law(const std::vector<double> &times, const std::vector<double> &msd) const;

    /// Least-squares slope through the origin, alpha fixed at 1, D clamped at 0.
    FitOutcome fit_linear(const std::vector<double> &times, const std::vector<double> &msd) const;

  private:
    enum class Stage { power_law, linear, done };

    AnalysisConfig config_; ///< Copied, so a fitter may outlive the config it was built from.

    // Residual 4 D t^alpha - msd for one lag
    struct PowerLawResidual {
        PowerLawResidual(double t, double msd)
          : t_(t)
          , msd_(msd) {}

        template<typename T>
        bool operator()(const T *const D, const T *const alpha, T *residual) const {
            using std::pow;
            residual[0] = T(4.0) * D[0] * pow(T(t_), alpha[0]) - T(msd_);
            return true;
        }

      private:
        const double t_;
        const double msd_;
    };

    // Starting point from a straight-line fit in log-log space
    void initial_guess(const std::vector<double> &times,
                       const std::vector<double> &msd,
                       double &D0,
                       double &alpha0) const;
};

} // namespace msd_fit

#endif // CURVE_FITTER_HPP
