#include "phasecloud/fitting/ResidualCalculator.hpp"
#include "phasecloud/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace phasecloud {
namespace fitting {

std::string ResidualCalculator::Result::toString() const {
    std::stringstream ss;
    ss << "Residual over " << cloud.size() << " points: mean " << meanResidual
       << ", range [" << minResidual << ", " << maxResidual << "]";
    if (droppedCount > 0) {
        ss << ", " << droppedCount << " dropped at surface poles";
    }
    return ss.str();
}

ResidualCalculator::Result ResidualCalculator::apply(core::PointCloud&& cloud,
                                                     const core::FitCoefficients& coefficients) const {
    Result result;
    result.cloud = std::move(cloud);
    auto& points = result.cloud.points;

    if (points.empty()) {
        result.minResidual = std::numeric_limits<double>::quiet_NaN();
        result.maxResidual = std::numeric_limits<double>::quiet_NaN();
        return result;
    }

    const long n = static_cast<long>(points.size());
#ifdef _OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (long i = 0; i < n; ++i) {
        core::PhasePoint& p = points[static_cast<size_t>(i)];
        p.z -= coefficients.evaluate(p.x, p.y);
    }

    // Compact in order, dropping poles, and fold the statistics
    size_t kept = 0;
    double sum = 0.0;
    double minZ = std::numeric_limits<double>::infinity();
    double maxZ = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < points.size(); ++i) {
        const double z = points[i].z;
        if (!std::isfinite(z)) {
            continue;
        }
        points[kept++] = points[i];
        sum += z;
        minZ = std::min(minZ, z);
        maxZ = std::max(maxZ, z);
    }
    result.droppedCount = points.size() - kept;
    points.resize(kept);

    if (result.droppedCount > 0) {
        PHASECLOUD_LOG_WARNING("ResidualCalculator")
            << result.droppedCount << " point(s) lie on a pole of the fitted surface and were dropped";
    }

    if (points.empty()) {
        result.minResidual = std::numeric_limits<double>::quiet_NaN();
        result.maxResidual = std::numeric_limits<double>::quiet_NaN();
        return result;
    }

    result.meanResidual = sum / static_cast<double>(kept);
    result.minResidual = minZ;
    result.maxResidual = maxZ;

    if (config_.zeroMean) {
        const double mean = result.meanResidual;
        for (auto& p : points) {
            p.z -= mean;
        }
        result.minResidual -= mean;
        result.maxResidual -= mean;
    }

    PHASECLOUD_LOG_DEBUG("ResidualCalculator") << result.toString()
                                               << (config_.zeroMean ? " (zero-centred)" : "");
    return result;
}

} // namespace fitting
} // namespace phasecloud
