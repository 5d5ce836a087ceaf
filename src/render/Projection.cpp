#include "phasecloud/render/Projection.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace phasecloud {
namespace render {

std::string ViewParams::toString() const {
    std::stringstream ss;
    ss << "yaw=" << yaw << " pitch=" << pitch << " scale=" << scale
       << " margin=" << margin << " pointRadius=" << pointRadius;
    return ss.str();
}

Projection::Projection(const core::RenderRange& range, const cv::Size& imageSize, const ViewParams& view)
    : range_(range)
    , imageSize_(imageSize)
    , view_(view) {
    const double cy = std::cos(view.yaw);
    const double sy = std::sin(view.yaw);
    const double cp = std::cos(view.pitch);
    const double sp = std::sin(view.pitch);

    const cv::Matx33d yawRotation(cy, 0.0, sy,
                                  0.0, 1.0, 0.0,
                                  -sy, 0.0, cy);
    const cv::Matx33d pitchRotation(1.0, 0.0, 0.0,
                                    0.0, cp, -sp,
                                    0.0, sp, cp);
    rotation_ = pitchRotation * yawRotation;

    // The rotated cube never exceeds its diagonal, sqrt(3)
    const double plotWidth = std::max(1, imageSize.width - 2 * view.margin);
    const double plotHeight = std::max(1, imageSize.height - 2 * view.margin);
    pixelScale_ = view.scale * std::min(plotWidth, plotHeight) / std::sqrt(3.0);
    center_ = cv::Point2d(imageSize.width / 2.0, imageSize.height / 2.0);
}

cv::Vec3d Projection::toCube(double x, double y, double z) const {
    return cv::Vec3d(range_.x.normalize(x) - 0.5,
                     range_.y.normalize(y) - 0.5,
                     range_.z.normalize(z) - 0.5);
}

cv::Vec3d Projection::rotate(const cv::Vec3d& cube) const {
    return rotation_ * cube;
}

cv::Point2d Projection::toScreen(const cv::Vec3d& view) const {
    // Image rows grow downwards
    return cv::Point2d(center_.x + pixelScale_ * view[0],
                       center_.y - pixelScale_ * view[1]);
}

Projection::Projected Projection::project(double x, double y, double z) const {
    const cv::Vec3d view = rotate(toCube(x, y, z));
    Projected out;
    out.screen = toScreen(view);
    out.depth = view[2];
    return out;
}

double Projection::depth(double x, double y, double z) const {
    return rotate(toCube(x, y, z))[2];
}

} // namespace render
} // namespace phasecloud
