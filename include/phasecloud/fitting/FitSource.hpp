#pragma once

#include "phasecloud/core/types.hpp"
#include "phasecloud/fitting/SurfaceFitter.hpp"
#include <string>
#include <variant>

namespace phasecloud {
namespace fitting {

/**
 * @brief Tag: fit the surface to the pipeline's own point cloud
 */
struct ComputedFit {};

/**
 * @brief Where the surface coefficients come from
 *
 * Either computed from the cloud by SurfaceFitter or supplied by the caller.
 * Resolved once into a FitCoefficients value before residuals are taken.
 */
using FitSource = std::variant<ComputedFit, core::FitCoefficients>;

struct ResolvedFit {
    core::FitCoefficients coefficients;
    bool computed = false;     ///< true when SurfaceFitter produced the coefficients
};

/**
 * @brief Resolve a fit source into concrete coefficients
 *
 * @throws InsufficientDataException, FitDivergenceException from the fitter
 */
ResolvedFit resolveFit(const FitSource& source,
                       const core::PointCloud& cloud,
                       const SurfaceFitter& fitter);

std::string describeFitSource(const FitSource& source);

} // namespace fitting
} // namespace phasecloud
