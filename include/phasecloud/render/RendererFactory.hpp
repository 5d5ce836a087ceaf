#pragma once

#include "phasecloud/render/GnuplotRenderer.hpp"
#include "phasecloud/render/Renderer.hpp"
#include <memory>

namespace phasecloud {
namespace render {

struct RendererConfig {
    Backend backend = Backend::CHART;
    GnuplotRenderer::Config gnuplot;
};

std::unique_ptr<Renderer> createRenderer(const RendererConfig& config);

} // namespace render
} // namespace phasecloud
