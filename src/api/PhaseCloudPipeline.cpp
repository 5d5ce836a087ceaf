#include "phasecloud/api/PhaseCloudPipeline.hpp"
#include "phasecloud/core/Logger.hpp"
#include "phasecloud/core/Timer.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/fitting/FitSource.hpp"
#include "phasecloud/fitting/ResidualCalculator.hpp"
#include "phasecloud/fitting/SurfaceFitter.hpp"
#include "phasecloud/io/ArrayIO.hpp"
#include "phasecloud/pointcloud/PointCloudBuilder.hpp"
#include "phasecloud/render/ColorRamp.hpp"
#include "phasecloud/render/DepthColorMapper.hpp"
#include "phasecloud/render/Projection.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace phasecloud {
namespace api {

namespace {
const char* const kComponent = "PhaseCloudPipeline";
}

std::string PhaseCloudPipeline::PipelineResult::toString() const {
    std::stringstream ss;
    ss << "Pipeline result:\n"
       << "  points: " << retainedCount << " retained, " << rejectedCount << " rejected, "
       << droppedCount << " dropped at surface poles\n"
       << "  phase range: [" << minPhase << ", " << maxPhase << "]\n"
       << "  fit (" << (fitComputed ? "computed" : "supplied") << "): " << coefficients.toString() << "\n"
       << "  residual: mean " << meanResidual << ", range [" << minResidual << ", " << maxResidual << "]\n"
       << "  rendered points: " << scene.points.size();
    return ss.str();
}

PhaseCloudPipeline::PhaseCloudPipeline(const PipelineConfig& config)
    : PhaseCloudPipeline(config, render::createRenderer(config.renderer)) {}

PhaseCloudPipeline::PhaseCloudPipeline(const PipelineConfig& config,
                                       std::unique_ptr<render::Renderer> renderer)
    : config_(config)
    , renderer_(std::move(renderer)) {
    config_.validate();
    if (!renderer_) {
        PHASECLOUD_THROW(core::ConfigException, "Pipeline needs a renderer");
    }
    PHASECLOUD_LOG_DEBUG(kComponent) << config_.toString();
}

core::RenderRange PhaseCloudPipeline::computeRange(const PipelineConfig& config, int rows, int cols,
                                                   double minResidual, double maxResidual) {
    core::RenderRange range;
    range.x = core::AxisRange(0.0, static_cast<double>(cols));
    if (config.mirror) {
        range.x = range.x.reversed();
    }
    range.y = core::AxisRange(static_cast<double>(rows), 0.0);

    if (config.zRange) {
        range.z = *config.zRange;
    } else if (std::isfinite(minResidual) && std::isfinite(maxResidual)) {
        range.z = core::AxisRange(minResidual, maxResidual);
    } else {
        range.z = core::AxisRange(0.0, 1.0);
    }
    return range;
}

void PhaseCloudPipeline::printCoefficients(std::ostream& os, const core::FitCoefficients& coefficients) {
    const std::ios::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::setprecision(12);
    os << "a = " << coefficients.a << "\n"
       << "b = " << coefficients.b << "\n"
       << "c = " << coefficients.c << "\n"
       << "d = " << coefficients.d << "\n"
       << "e = " << coefficients.e << std::endl;
    os.flags(flags);
    os.precision(precision);
}

PhaseCloudPipeline::PipelineResult PhaseCloudPipeline::process(const cv::Mat& phase,
                                                               const cv::Mat& quality) const {
    core::Timer timer;
    PipelineResult result;

    timer.start("build");
    pointcloud::PointCloudBuilder::Config builderConfig;
    builderConfig.qualityThreshold = config_.threshold;
    pointcloud::PointCloudBuilder::BuildResult built =
        pointcloud::PointCloudBuilder(builderConfig).build(phase, quality);
    result.retainedCount = built.cloud.size();
    result.rejectedCount = built.rejectedCount;
    result.minPhase = built.minPhase;
    result.maxPhase = built.maxPhase;
    PHASECLOUD_LOG_INFO(kComponent) << built.toString();
    PHASECLOUD_LOG_DEBUG(kComponent) << "Point cloud built in " << timer.stop("build") << " ms";

    timer.start("fit");
    const fitting::SurfaceFitter fitter;
    const fitting::ResolvedFit fit = fitting::resolveFit(config_.fitSource(), built.cloud, fitter);
    result.coefficients = fit.coefficients;
    result.fitComputed = fit.computed;
    PHASECLOUD_LOG_DEBUG(kComponent) << "Fit resolved in " << timer.stop("fit") << " ms";

    timer.start("residual");
    fitting::ResidualCalculator::Config residualConfig;
    residualConfig.zeroMean = config_.center;
    fitting::ResidualCalculator::Result residual =
        fitting::ResidualCalculator(residualConfig).apply(std::move(built.cloud), fit.coefficients);
    result.droppedCount = residual.droppedCount;
    result.meanResidual = residual.meanResidual;
    result.minResidual = residual.minResidual;
    result.maxResidual = residual.maxResidual;
    PHASECLOUD_LOG_INFO(kComponent) << residual.toString();
    PHASECLOUD_LOG_DEBUG(kComponent) << "Residual computed in " << timer.stop("residual") << " ms";

    if (residual.cloud.empty()) {
        PHASECLOUD_LOG_WARNING(kComponent) << "No points left to render";
    }

    timer.start("color");
    render::RenderScene& scene = result.scene;
    scene.range = computeRange(config_, phase.rows, phase.cols, residual.minResidual, residual.maxResidual);
    scene.imageSize = config_.dimensions;
    scene.view = config_.view;

    const bool periodic = config_.colorMode == render::ColorNormalization::Mode::PERIODIC;
    const render::DepthColorMapper mapper(
        periodic ? render::ColorRamp::rainbow() : render::ColorRamp::viridis(),
        periodic ? render::ColorNormalization::periodic(config_.colorPeriod)
                 : render::ColorNormalization::clamped(scene.range.z.start, scene.range.z.end));

    if (renderer_->requiresDepthOrder()) {
        const render::Projection projection(scene.range, scene.imageSize, scene.view);
        scene.points = mapper.colorize(std::move(residual.cloud), &projection);
    } else {
        scene.points = mapper.colorize(std::move(residual.cloud), nullptr);
    }
    PHASECLOUD_LOG_DEBUG(kComponent) << "Colour mapping (" << render::colorModeToString(config_.colorMode)
                                     << ") in " << timer.stop("color") << " ms";

    return result;
}

PhaseCloudPipeline::PipelineResult PhaseCloudPipeline::run(const cv::Mat& phase,
                                                           const cv::Mat& quality,
                                                           const std::string& outputPath) {
    PipelineResult result = process(phase, quality);

    if (result.fitComputed) {
        printCoefficients(std::cout, result.coefficients);
    }

    core::Timer timer;
    timer.start("render");
    renderer_->render(result.scene, outputPath);
    PHASECLOUD_LOG_DEBUG(kComponent) << "Rendered with " << renderer_->getName() << " in "
                                     << timer.stop("render") << " ms";
    PHASECLOUD_LOG_INFO(kComponent) << result.toString();
    return result;
}

PhaseCloudPipeline::PipelineResult PhaseCloudPipeline::runFromFiles(const std::string& unwrappedPath,
                                                                    const std::string& qualityPath,
                                                                    const std::string& outputPath) {
    core::Timer timer;
    timer.start("load");
    const cv::Mat phase = io::ArrayIO::load(unwrappedPath);
    const cv::Mat quality = io::ArrayIO::load(qualityPath);
    PHASECLOUD_LOG_DEBUG(kComponent) << "Loaded " << unwrappedPath << " (" << phase.rows << "x" << phase.cols
                                     << ") and " << qualityPath << " (" << quality.rows << "x" << quality.cols
                                     << ") in " << timer.stop("load") << " ms";
    return run(phase, quality, outputPath);
}

} // namespace api
} // namespace phasecloud
