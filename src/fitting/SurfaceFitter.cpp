/**
 * @file SurfaceFitter.cpp
 * @brief SVD-based minimum-norm solve of the linearised rational surface
 */

#include "phasecloud/fitting/SurfaceFitter.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace phasecloud {
namespace fitting {

namespace {
const char* const kComponent = "SurfaceFitter";
}

std::string SurfaceFitter::FitReport::toString() const {
    std::stringstream ss;
    ss << "Surface fit over " << pointCount << " points: " << coefficients.toString()
       << ", rank " << rank << "/" << core::FitCoefficients::COUNT
       << ", RMS " << std::scientific << std::setprecision(3) << rmsResidual;
    return ss.str();
}

void SurfaceFitter::buildLinearSystem(const core::PointCloud& cloud, cv::Mat& design, cv::Mat& target) {
    const int n = static_cast<int>(cloud.size());
    design.create(n, static_cast<int>(core::FitCoefficients::COUNT), CV_64F);
    target.create(n, 1, CV_64F);

    for (int i = 0; i < n; ++i) {
        const core::PhasePoint& p = cloud.points[static_cast<size_t>(i)];
        double* row = design.ptr<double>(i);
        row[0] = p.x;
        row[1] = p.y;
        row[2] = 1.0;
        row[3] = -p.x * p.z;
        row[4] = -p.y * p.z;
        target.at<double>(i, 0) = p.z;
    }
}

core::FitCoefficients SurfaceFitter::fit(const core::PointCloud& cloud) const {
    return fitWithReport(cloud).coefficients;
}

SurfaceFitter::FitReport SurfaceFitter::fitWithReport(const core::PointCloud& cloud) const {
    const size_t n = cloud.size();
    if (n < MIN_POINTS) {
        PHASECLOUD_THROW(core::InsufficientDataException,
                         "Surface fit needs at least " + std::to_string(MIN_POINTS) +
                         " points above the quality threshold, got " + std::to_string(n));
    }

    cv::Mat design;
    cv::Mat target;
    buildLinearSystem(cloud, design, target);

    if (!cv::checkRange(design) || !cv::checkRange(target)) {
        PHASECLOUD_THROW(core::FitDivergenceException,
                         "Design matrix contains non-finite values");
    }

    cv::Mat w;
    cv::Mat u;
    cv::Mat vt;
    try {
        cv::SVD::compute(design, w, u, vt);
    } catch (const cv::Exception& e) {
        PHASECLOUD_THROW(core::FitDivergenceException,
                         std::string("Singular value decomposition failed: ") + e.what());
    }

    const double sigmaMax = w.at<double>(0, 0);
    if (!std::isfinite(sigmaMax) || sigmaMax <= 0.0) {
        PHASECLOUD_THROW(core::FitDivergenceException,
                         "Design matrix is numerically singular (largest singular value " +
                         std::to_string(sigmaMax) + ")");
    }

    const double cutoff = config_.rcond * sigmaMax;

    // Pseudo-inverse restricted to the retained singular directions
    cv::Mat projected = u.t() * target;
    cv::Mat scaled = cv::Mat::zeros(w.rows, 1, CV_64F);
    FitReport report;
    report.pointCount = n;
    for (int i = 0; i < w.rows; ++i) {
        const double sigma = w.at<double>(i, 0);
        report.singularValues.push_back(sigma);
        if (sigma > cutoff) {
            scaled.at<double>(i, 0) = projected.at<double>(i, 0) / sigma;
            ++report.rank;
        }
    }
    cv::Mat solution = vt.t() * scaled;

    if (!cv::checkRange(solution)) {
        PHASECLOUD_THROW(core::FitDivergenceException,
                         "Least-squares solution is not finite");
    }

    report.coefficients = core::FitCoefficients::fromVector({
        solution.at<double>(0, 0), solution.at<double>(1, 0), solution.at<double>(2, 0),
        solution.at<double>(3, 0), solution.at<double>(4, 0)});

    cv::Mat residual = design * solution - target;
    report.rmsResidual = cv::norm(residual, cv::NORM_L2) / std::sqrt(static_cast<double>(n));

    if (report.rank < static_cast<int>(core::FitCoefficients::COUNT)) {
        PHASECLOUD_LOG_INFO(kComponent) << "Rank-deficient design (rank " << report.rank
                                        << "/5), using the minimum-norm solution";
    }
    PHASECLOUD_LOG_INFO(kComponent) << report.toString();
    return report;
}

} // namespace fitting
} // namespace phasecloud
