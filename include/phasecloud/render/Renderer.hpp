#pragma once

#include "phasecloud/core/types.hpp"
#include "phasecloud/render/DepthColorMapper.hpp"
#include "phasecloud/render/Projection.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace phasecloud {
namespace render {

/**
 * @brief Everything a backend needs to draw one image
 *
 * points are already coloured and, for backends that require it, sorted
 * farther-first.
 */
struct RenderScene {
    std::vector<ColoredPoint> points;
    core::RenderRange range;
    cv::Size imageSize{640, 480};
    ViewParams view;
};

/**
 * @brief Output backend for the coloured point cloud
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual std::string getName() const = 0;

    /**
     * @brief Whether the scene must arrive in ascending projected-depth order
     *
     * Backends doing their own hidden-surface handling return false and only
     * consume colours.
     */
    virtual bool requiresDepthOrder() const = 0;

    /**
     * @brief Produce the image at outputPath
     * @throws RenderException on any failure
     */
    virtual void render(const RenderScene& scene, const std::string& outputPath) = 0;
};

enum class Backend {
    CHART,       ///< In-process OpenCV drawing
    GNUPLOT      ///< Generated splot script run through gnuplot
};

/**
 * @brief Parse "chart" or "gnuplot"
 * @throws ConfigException for any other name
 */
Backend parseBackend(const std::string& name);

std::string backendToString(Backend backend);

} // namespace render
} // namespace phasecloud
