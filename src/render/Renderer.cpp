#include "phasecloud/render/Renderer.hpp"
#include "phasecloud/render/ChartRenderer.hpp"
#include "phasecloud/render/RendererFactory.hpp"
#include "phasecloud/core/exception.h"

namespace phasecloud {
namespace render {

Backend parseBackend(const std::string& name) {
    if (name == "chart") {
        return Backend::CHART;
    }
    if (name == "gnuplot") {
        return Backend::GNUPLOT;
    }
    PHASECLOUD_THROW(core::ConfigException,
                     "Unknown backend '" + name + "' (expected chart or gnuplot)");
}

std::string backendToString(Backend backend) {
    switch (backend) {
        case Backend::CHART:   return "chart";
        case Backend::GNUPLOT: return "gnuplot";
    }
    return "unknown";
}

std::unique_ptr<Renderer> createRenderer(const RendererConfig& config) {
    switch (config.backend) {
        case Backend::GNUPLOT:
            return std::make_unique<GnuplotRenderer>(config.gnuplot);
        case Backend::CHART:
        default:
            return std::make_unique<ChartRenderer>();
    }
}

} // namespace render
} // namespace phasecloud
