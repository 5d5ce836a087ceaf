#pragma once

/**
 * @file phasecloud.h
 * @brief Main header for the phasecloud library
 *
 * Include this single header to access the complete pipeline: loading,
 * quality filtering, rational surface fit, residuals, colour mapping and
 * rendering.
 */

// Core types and utilities
#include "phasecloud/core/types.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include "phasecloud/core/Configuration.hpp"

// Stages
#include "phasecloud/io/ArrayIO.hpp"
#include "phasecloud/pointcloud/PointCloudBuilder.hpp"
#include "phasecloud/fitting/SurfaceFitter.hpp"
#include "phasecloud/fitting/FitSource.hpp"
#include "phasecloud/fitting/ResidualCalculator.hpp"
#include "phasecloud/render/ColorRamp.hpp"
#include "phasecloud/render/DepthColorMapper.hpp"
#include "phasecloud/render/Projection.hpp"
#include "phasecloud/render/Renderer.hpp"
#include "phasecloud/render/ChartRenderer.hpp"
#include "phasecloud/render/GnuplotRenderer.hpp"
#include "phasecloud/render/RendererFactory.hpp"

// Pipeline API
#include "phasecloud/api/PipelineConfig.hpp"
#include "phasecloud/api/PhaseCloudPipeline.hpp"

#include <string>

namespace phasecloud {

/**
 * @brief Library version string
 */
inline std::string getVersionString() {
    return "1.0.0";
}

} // namespace phasecloud
