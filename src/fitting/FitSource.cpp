#include "phasecloud/fitting/FitSource.hpp"
#include "phasecloud/core/Logger.hpp"

namespace phasecloud {
namespace fitting {

ResolvedFit resolveFit(const FitSource& source,
                       const core::PointCloud& cloud,
                       const SurfaceFitter& fitter) {
    ResolvedFit resolved;

    if (const auto* supplied = std::get_if<core::FitCoefficients>(&source)) {
        resolved.coefficients = *supplied;
        resolved.computed = false;
        PHASECLOUD_LOG_INFO("FitSource") << "Using supplied coefficients "
                                         << supplied->toString();
        return resolved;
    }

    resolved.coefficients = fitter.fit(cloud);
    resolved.computed = true;
    return resolved;
}

std::string describeFitSource(const FitSource& source) {
    if (const auto* supplied = std::get_if<core::FitCoefficients>(&source)) {
        return "supplied " + supplied->toString();
    }
    return "computed";
}

} // namespace fitting
} // namespace phasecloud
