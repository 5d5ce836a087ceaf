#pragma once

#include "phasecloud/api/PipelineConfig.hpp"
#include "phasecloud/core/types.hpp"
#include "phasecloud/render/Renderer.hpp"
#include <opencv2/core.hpp>
#include <iosfwd>
#include <memory>
#include <string>

namespace phasecloud {
namespace api {

/**
 * @brief Surface-fit and residual pipeline from phase/quality fields to an image
 *
 * Stages, each consuming the previous stage's cloud:
 * - PointCloudBuilder: quality filter and flatten
 * - resolveFit: supplied coefficients or SurfaceFitter
 * - ResidualCalculator: subtract the fitted surface (optionally zero-mean)
 * - DepthColorMapper: colour by residual, depth-sort when the renderer needs it
 * - Renderer: chart or gnuplot backend
 *
 * The pipeline holds no state between runs.
 */
class PhaseCloudPipeline {
public:
    /**
     * @brief Outcome of the numerical stages
     */
    struct PipelineResult {
        render::RenderScene scene;
        core::FitCoefficients coefficients;
        bool fitComputed = false;              ///< false when coefficients were supplied

        size_t retainedCount = 0;              ///< Points passing the quality filter
        size_t rejectedCount = 0;
        size_t droppedCount = 0;               ///< Points at a pole of the surface
        double minPhase = 0.0;
        double maxPhase = 0.0;

        double meanResidual = 0.0;             ///< Post-fit mean before centring
        double minResidual = 0.0;
        double maxResidual = 0.0;

        std::string toString() const;
    };

    /**
     * @brief Pipeline with the renderer selected by config.renderer
     * @throws ConfigException when the configuration is invalid
     */
    explicit PhaseCloudPipeline(const PipelineConfig& config);

    /**
     * @brief Pipeline drawing through the given renderer
     * @throws ConfigException when the configuration is invalid or renderer is null
     */
    PhaseCloudPipeline(const PipelineConfig& config, std::unique_ptr<render::Renderer> renderer);

    const PipelineConfig& getConfig() const { return config_; }
    const render::Renderer& getRenderer() const { return *renderer_; }

    /**
     * @brief Run every stage except rendering
     */
    PipelineResult process(const cv::Mat& phase, const cv::Mat& quality) const;

    /**
     * @brief process(), report computed coefficients on stdout, then render to outputPath
     */
    PipelineResult run(const cv::Mat& phase, const cv::Mat& quality, const std::string& outputPath);

    /**
     * @brief Load both arrays with io::ArrayIO, then run()
     */
    PipelineResult runFromFiles(const std::string& unwrappedPath,
                                const std::string& qualityPath,
                                const std::string& outputPath);

    /**
     * @brief Axis ranges of the view
     *
     * x = [0, cols] ([cols, 0] when mirrored), y = [rows, 0], z = the configured
     * range or [minResidual, maxResidual].
     */
    static core::RenderRange computeRange(const PipelineConfig& config, int rows, int cols,
                                          double minResidual, double maxResidual);

    /**
     * @brief Write "a = <v>" .. "e = <v>", one per line
     */
    static void printCoefficients(std::ostream& os, const core::FitCoefficients& coefficients);

private:
    PipelineConfig config_;
    std::unique_ptr<render::Renderer> renderer_;
};

} // namespace api
} // namespace phasecloud
