#include "phasecloud/api/PipelineConfig.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <cmath>
#include <sstream>

namespace phasecloud {
namespace api {

void PipelineConfig::validate() const {
    if (dimensions.width <= 0 || dimensions.height <= 0) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Dimensions must be positive, got " + std::to_string(dimensions.width) +
                         "x" + std::to_string(dimensions.height));
    }
    if (!std::isfinite(threshold)) {
        PHASECLOUD_THROW(core::ConfigException, "Quality threshold must be finite");
    }
    if (zRange) {
        if (!std::isfinite(zRange->start) || !std::isfinite(zRange->end)) {
            PHASECLOUD_THROW(core::ConfigException, "z range bounds must be finite");
        }
        if (zRange->span() == 0.0) {
            PHASECLOUD_THROW(core::ConfigException,
                             "z range is empty (" + std::to_string(zRange->start) + ".." +
                             std::to_string(zRange->end) + ")");
        }
    }
    if (!std::isfinite(colorPeriod) || colorPeriod <= 0.0) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Colour period must be positive, got " + std::to_string(colorPeriod));
    }
    if (fitCoefficients) {
        if (fitCoefficients->size() != core::FitCoefficients::COUNT) {
            PHASECLOUD_THROW(core::ConfigException,
                             "Expected 5 fit coefficients (a,b,c,d,e), got " +
                             std::to_string(fitCoefficients->size()));
        }
        for (double v : *fitCoefficients) {
            if (!std::isfinite(v)) {
                PHASECLOUD_THROW(core::ConfigException, "Fit coefficients must be finite");
            }
        }
    }
    if (!std::isfinite(view.yaw) || !std::isfinite(view.pitch)) {
        PHASECLOUD_THROW(core::ConfigException, "View angles must be finite");
    }
    if (!(view.scale > 0.0) || !std::isfinite(view.scale)) {
        PHASECLOUD_THROW(core::ConfigException, "View scale must be positive");
    }
    if (view.pointRadius < 1) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Point radius must be at least 1, got " + std::to_string(view.pointRadius));
    }
    if (view.margin < 0) {
        PHASECLOUD_THROW(core::ConfigException, "Margin must not be negative");
    }
    if (renderer.backend == render::Backend::GNUPLOT) {
        if (renderer.gnuplot.executable.empty()) {
            PHASECLOUD_THROW(core::ConfigException, "gnuplot executable must not be empty");
        }
        if (renderer.gnuplot.terminal.empty()) {
            PHASECLOUD_THROW(core::ConfigException, "gnuplot terminal must not be empty");
        }
    }
    core::parseLogLevel(logLevel);
}

std::string PipelineConfig::toString() const {
    std::stringstream ss;
    ss << "PipelineConfig:\n"
       << "  dimensions: " << dimensions.width << "x" << dimensions.height << "\n"
       << "  threshold: " << threshold << "\n"
       << "  zlim: ";
    if (zRange) {
        ss << zRange->start << ".." << zRange->end;
    } else {
        ss << "auto";
    }
    ss << "\n"
       << "  mirror: " << (mirror ? "yes" : "no") << "\n"
       << "  center: " << (center ? "yes" : "no") << "\n"
       << "  color-mode: " << render::colorModeToString(colorMode) << "\n"
       << "  color-period: " << colorPeriod << "\n"
       << "  fit: " << fitting::describeFitSource(fitSource()) << "\n"
       << "  backend: " << render::backendToString(renderer.backend) << "\n"
       << "  view: " << view.toString();
    if (renderer.backend == render::Backend::GNUPLOT) {
        ss << "\n  gnuplot: " << renderer.gnuplot.executable
           << " (terminal " << renderer.gnuplot.terminal << ")";
    }
    return ss.str();
}

fitting::FitSource PipelineConfig::fitSource() const {
    if (fitCoefficients) {
        return core::FitCoefficients::fromVector(*fitCoefficients);
    }
    return fitting::ComputedFit{};
}

} // namespace api
} // namespace phasecloud
