#pragma once

#include "phasecloud/core/types.hpp"
#include "phasecloud/fitting/FitSource.hpp"
#include "phasecloud/render/DepthColorMapper.hpp"
#include "phasecloud/render/Projection.hpp"
#include "phasecloud/render/RendererFactory.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace phasecloud {
namespace api {

/**
 * @brief All options of one pipeline run, with their defaults
 */
struct PipelineConfig {
    cv::Size dimensions{640, 480};                 ///< Output image width x height
    double threshold = 0.0;                        ///< Points need quality > threshold
    std::optional<core::AxisRange> zRange;         ///< Depth/colour axis, default residual extrema
    bool mirror = false;                           ///< Flip the x axis
    bool center = false;                           ///< Subtract the post-fit mean residual

    render::ColorNormalization::Mode colorMode = render::ColorNormalization::Mode::CLAMPED;
    double colorPeriod = 1.0;                      ///< Periodic mode wrap length

    std::optional<std::vector<double>> fitCoefficients;   ///< a, b, c, d, e; skips the fit

    render::RendererConfig renderer;               ///< Backend and gnuplot settings
    render::ViewParams view;                       ///< Chart camera

    std::string logLevel = "warning";
    std::string logFile;

    /**
     * @throws ConfigException on the first invalid value
     */
    void validate() const;

    std::string toString() const;

    /**
     * @brief Supplied coefficients when given, otherwise a computed fit
     */
    fitting::FitSource fitSource() const;
};

} // namespace api
} // namespace phasecloud
