#pragma once

#include "phasecloud/core/types.hpp"
#include <cstddef>
#include <string>

namespace phasecloud {
namespace fitting {

/**
 * @brief Subtracts the fitted rational surface from every point
 *
 * After apply() the z of each point is the residual z - fitted_z; x and y are
 * unchanged. The input cloud is consumed, since its z no longer means phase.
 */
class ResidualCalculator {
public:
    struct Config {
        bool zeroMean = false;     ///< Subtract the post-fit mean residual
    };

    struct Result {
        core::PointCloud cloud;
        double meanResidual = 0.0;     ///< Post-fit mean, before any centring
        double minResidual = 0.0;      ///< Extrema of the output z (NaN when empty)
        double maxResidual = 0.0;
        size_t droppedCount = 0;       ///< Points at a pole of the fitted surface

        std::string toString() const;
    };

    ResidualCalculator() = default;
    explicit ResidualCalculator(const Config& config) : config_(config) {}

    const Config& getConfig() const { return config_; }

    /**
     * @brief Replace each point's z by its residual
     *
     * An empty cloud yields an empty result. Points whose fitted value or
     * residual is not finite are dropped.
     */
    Result apply(core::PointCloud&& cloud, const core::FitCoefficients& coefficients) const;

private:
    Config config_;
};

} // namespace fitting
} // namespace phasecloud
