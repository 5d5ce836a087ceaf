#include "phasecloud/render/ChartRenderer.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>

namespace phasecloud {
namespace render {

namespace {

const char* const kComponent = "ChartRenderer";

const cv::Scalar kBackground(255, 255, 255);
const cv::Scalar kPanelFill(246, 246, 246);
const cv::Scalar kGridColor(222, 222, 222);
const cv::Scalar kEdgeColor(150, 150, 150);
const cv::Scalar kLabelColor(60, 60, 60);

constexpr double kLabelOffset = 14.0;
constexpr double kFontScale = 0.35;
constexpr double kClipTolerance = 1e-9;

cv::Vec3d cubeCorner(int axis, double along, int u, double atU, int v, double atV) {
    cv::Vec3d c;
    c[axis] = along;
    c[u] = atU;
    c[v] = atV;
    return c;
}

cv::Point toPixel(const cv::Point2d& p) {
    return cv::Point(cvRound(p.x), cvRound(p.y));
}

const core::AxisRange& axisRange(const core::RenderRange& range, int axis) {
    switch (axis) {
        case 0: return range.x;
        case 1: return range.y;
        default: return range.z;
    }
}

std::string formatTick(double value) {
    std::ostringstream ss;
    ss.precision(3);
    ss << (std::abs(value) < 1e-12 ? 0.0 : value);
    return ss.str();
}

} // namespace

cv::Mat ChartRenderer::draw(const RenderScene& scene) const {
    if (scene.imageSize.width <= 0 || scene.imageSize.height <= 0) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_INVALID_PARAMETER,
                              "Image size must be positive, got " + std::to_string(scene.imageSize.width) +
                              "x" + std::to_string(scene.imageSize.height));
    }

    cv::Mat canvas(scene.imageSize, CV_8UC3, kBackground);
    const Projection projection(scene.range, scene.imageSize, scene.view);

    drawAxes(canvas, projection);
    drawTickLabels(canvas, projection);
    const size_t drawn = drawPoints(canvas, scene, projection);

    PHASECLOUD_LOG_DEBUG(kComponent) << "Drew " << drawn << " of " << scene.points.size()
                                     << " points (" << scene.view.toString() << ")";
    return canvas;
}

void ChartRenderer::render(const RenderScene& scene, const std::string& outputPath) {
    cv::Mat canvas = draw(scene);

    bool written = false;
    try {
        written = cv::imwrite(outputPath, canvas);
    } catch (const cv::Exception& e) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_RENDER_FAILURE,
                              "Cannot write " + outputPath + ": " + e.what());
    }
    if (!written) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_RENDER_FAILURE,
                              "Cannot write " + outputPath);
    }

    PHASECLOUD_LOG_INFO(kComponent) << "Wrote " << canvas.cols << "x" << canvas.rows
                                    << " chart to " << outputPath;
}

void ChartRenderer::drawAxes(cv::Mat& canvas, const Projection& projection) const {
    for (int axis = 0; axis < 3; ++axis) {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;

        for (double side : {-0.5, 0.5}) {
            cv::Vec3d normal(0.0, 0.0, 0.0);
            normal[axis] = side > 0.0 ? 1.0 : -1.0;
            // Only faces turned away from the viewer sit behind the data
            if (projection.rotate(normal)[2] >= 0.0) {
                continue;
            }

            auto screen = [&](double a, double b) {
                return toPixel(projection.toScreen(projection.rotate(cubeCorner(axis, side, u, a, v, b))));
            };

            const std::array<cv::Point, 4> panel = {
                screen(-0.5, -0.5), screen(0.5, -0.5), screen(0.5, 0.5), screen(-0.5, 0.5)};
            cv::fillConvexPoly(canvas, panel.data(), static_cast<int>(panel.size()), kPanelFill, cv::LINE_AA);

            for (int i = 0; i < TICK_COUNT; ++i) {
                const double t = static_cast<double>(i) / (TICK_COUNT - 1) - 0.5;
                cv::line(canvas, screen(t, -0.5), screen(t, 0.5), kGridColor, 1, cv::LINE_AA);
                cv::line(canvas, screen(-0.5, t), screen(0.5, t), kGridColor, 1, cv::LINE_AA);
            }

            for (size_t i = 0; i < panel.size(); ++i) {
                cv::line(canvas, panel[i], panel[(i + 1) % panel.size()], kEdgeColor, 1, cv::LINE_AA);
            }
        }
    }
}

void ChartRenderer::drawTickLabels(cv::Mat& canvas, const Projection& projection) const {
    const cv::Point2d origin = projection.toScreen(projection.rotate(cv::Vec3d(0.0, 0.0, 0.0)));

    for (int axis = 0; axis < 3; ++axis) {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;

        // Vertical axis is labelled on its leftmost edge, the others on their lowest
        double bestScore = -std::numeric_limits<double>::infinity();
        double edgeU = -0.5;
        double edgeV = -0.5;
        for (double a : {-0.5, 0.5}) {
            for (double b : {-0.5, 0.5}) {
                const cv::Point2d mid = projection.toScreen(projection.rotate(cubeCorner(axis, 0.0, u, a, v, b)));
                const double score = axis == 1 ? -mid.x : mid.y;
                if (score > bestScore) {
                    bestScore = score;
                    edgeU = a;
                    edgeV = b;
                }
            }
        }

        const core::AxisRange& range = axisRange(projection.getRange(), axis);
        for (int i = 0; i < TICK_COUNT; ++i) {
            const double t = static_cast<double>(i) / (TICK_COUNT - 1);
            const cv::Point2d anchor =
                projection.toScreen(projection.rotate(cubeCorner(axis, t - 0.5, u, edgeU, v, edgeV)));

            cv::Point2d outward = anchor - origin;
            const double length = std::hypot(outward.x, outward.y);
            if (length > 0.0) {
                outward *= kLabelOffset / length;
            }

            const std::string label = formatTick(range.start + t * range.span());
            int baseline = 0;
            const cv::Size textSize = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, kFontScale, 1, &baseline);
            const cv::Point2d textOrigin(anchor.x + outward.x - textSize.width / 2.0,
                                         anchor.y + outward.y + textSize.height / 2.0);
            cv::putText(canvas, label, toPixel(textOrigin), cv::FONT_HERSHEY_SIMPLEX,
                        kFontScale, kLabelColor, 1, cv::LINE_AA);
        }
    }
}

size_t ChartRenderer::drawPoints(cv::Mat& canvas, const RenderScene& scene, const Projection& projection) const {
    const int radius = std::max(1, scene.view.pointRadius);
    size_t drawn = 0;

    for (const ColoredPoint& cp : scene.points) {
        const cv::Vec3d cube = projection.toCube(cp.point.x, cp.point.y, cp.point.z);
        bool inside = true;
        for (int k = 0; k < 3; ++k) {
            if (!(std::abs(cube[k]) <= 0.5 + kClipTolerance)) {
                inside = false;
            }
        }
        if (!inside) {
            continue;
        }

        const cv::Point2d screen = projection.toScreen(projection.rotate(cube));
        cv::circle(canvas, toPixel(screen), radius,
                   cv::Scalar(cp.color[0], cp.color[1], cp.color[2]), cv::FILLED, cv::LINE_AA);
        ++drawn;
    }
    return drawn;
}

} // namespace render
} // namespace phasecloud
