#pragma once

#include "phasecloud/render/Renderer.hpp"
#include <opencv2/core.hpp>

namespace phasecloud {
namespace render {

/**
 * @brief 3D scatter chart drawn with OpenCV
 *
 * White background, the three back panels of the axis cube with grid lines
 * and tick labels, then one filled circle per point in scene order.
 */
class ChartRenderer : public Renderer {
public:
    /// Grid lines per axis, including both ends
    static constexpr int TICK_COUNT = 6;

    std::string getName() const override { return "chart"; }
    bool requiresDepthOrder() const override { return true; }

    void render(const RenderScene& scene, const std::string& outputPath) override;

    /**
     * @brief Draw the scene into a new CV_8UC3 canvas
     */
    cv::Mat draw(const RenderScene& scene) const;

private:
    void drawAxes(cv::Mat& canvas, const Projection& projection) const;
    void drawTickLabels(cv::Mat& canvas, const Projection& projection) const;
    size_t drawPoints(cv::Mat& canvas, const RenderScene& scene, const Projection& projection) const;
};

} // namespace render
} // namespace phasecloud
