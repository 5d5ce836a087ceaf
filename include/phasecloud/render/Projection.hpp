#pragma once

#include "phasecloud/core/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace phasecloud {
namespace render {

/**
 * @brief Camera of the 3D chart view
 */
struct ViewParams {
    double yaw = 0.5;          ///< Rotation about the vertical axis (radians)
    double pitch = 0.15;       ///< Rotation about the horizontal axis (radians)
    double scale = 1.0;        ///< Zoom factor applied to the fitted cube
    int margin = 20;           ///< Blank border around the plot area (pixels)
    int pointRadius = 1;       ///< Marker radius (pixels)

    std::string toString() const;
};

/**
 * @brief Orthographic projection of the axis cube into the image
 *
 * Data coordinates are mapped into a unit cube centred at the origin, one
 * RenderRange axis per cube axis. Data x runs horizontally, data y is the
 * vertical axis and data z (the residual) runs into the screen. The cube is
 * rotated by yaw about the vertical axis, then by pitch about the horizontal
 * axis, and projected along the view direction. Depth grows toward the viewer.
 */
class Projection {
public:
    struct Projected {
        cv::Point2d screen;
        double depth = 0.0;
    };

    Projection(const core::RenderRange& range, const cv::Size& imageSize, const ViewParams& view);

    /**
     * @brief Unit-cube coordinates in [-0.5, 0.5] before rotation
     *
     * Component order is (horizontal, vertical, depth) = (data x, data y, data z).
     */
    cv::Vec3d toCube(double x, double y, double z) const;

    /**
     * @brief Rotate cube coordinates into view space
     */
    cv::Vec3d rotate(const cv::Vec3d& cube) const;

    /**
     * @brief Screen position of a view-space point
     */
    cv::Point2d toScreen(const cv::Vec3d& view) const;

    Projected project(double x, double y, double z) const;

    double depth(double x, double y, double z) const;

    const core::RenderRange& getRange() const { return range_; }
    const cv::Size& getImageSize() const { return imageSize_; }
    const ViewParams& getView() const { return view_; }

private:
    core::RenderRange range_;
    cv::Size imageSize_;
    ViewParams view_;
    cv::Matx33d rotation_;
    cv::Point2d center_;
    double pixelScale_;
};

} // namespace render
} // namespace phasecloud
