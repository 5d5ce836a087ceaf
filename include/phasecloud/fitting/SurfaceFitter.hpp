/**
 * @file SurfaceFitter.hpp
 * @brief Linear least-squares fit of the rational bilinear surface model
 *
 * z = (a*x + b*y + c) / (d*x + e*y + 1) becomes, after multiplying through
 * the denominator, the linear system a*x + b*y + c - d*(x*z) - e*(y*z) = z.
 * The fit solves that system exactly; it is not an iterative nonlinear fit.
 */

#ifndef PHASECLOUD_FITTING_SURFACE_FITTER_HPP
#define PHASECLOUD_FITTING_SURFACE_FITTER_HPP

#include "phasecloud/core/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace phasecloud {
namespace fitting {

class SurfaceFitter {
public:
    /// Fewer points leave the five coefficients underdetermined
    static constexpr size_t MIN_POINTS = 5;

    struct Config {
        /// Singular values at or below rcond * sigma_max are treated as zero
        double rcond = 1e-10;
    };

    /**
     * @brief Fit output with solver diagnostics
     */
    struct FitReport {
        core::FitCoefficients coefficients;
        int rank = 0;                          ///< Effective rank of the design matrix
        std::vector<double> singularValues;    ///< Descending
        double rmsResidual = 0.0;              ///< RMS of the linearised system residual
        size_t pointCount = 0;

        std::string toString() const;
    };

    SurfaceFitter() = default;
    explicit SurfaceFitter(const Config& config) : config_(config) {}

    const Config& getConfig() const { return config_; }

    /**
     * @brief Minimum-norm least-squares coefficients for the cloud
     *
     * @throws InsufficientDataException when the cloud has fewer than 5 points
     * @throws FitDivergenceException when the solve fails numerically
     */
    core::FitCoefficients fit(const core::PointCloud& cloud) const;

    FitReport fitWithReport(const core::PointCloud& cloud) const;

    /**
     * @brief Assemble rows [x, y, 1, -x*z, -y*z] and the target column z
     *
     * @param cloud Input points
     * @param design Output N x 5 CV_64F matrix
     * @param target Output N x 1 CV_64F matrix
     */
    static void buildLinearSystem(const core::PointCloud& cloud, cv::Mat& design, cv::Mat& target);

private:
    Config config_;
};

} // namespace fitting
} // namespace phasecloud

#endif // PHASECLOUD_FITTING_SURFACE_FITTER_HPP
