#include "phasecloud/render/DepthColorMapper.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace phasecloud {
namespace render {

ColorNormalization ColorNormalization::clamped(double zmin, double zmax) {
    return ColorNormalization(Mode::CLAMPED, zmin, zmax, 1.0);
}

ColorNormalization ColorNormalization::periodic(double period) {
    if (!std::isfinite(period) || period <= 0.0) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Colour period must be positive, got " + std::to_string(period));
    }
    return ColorNormalization(Mode::PERIODIC, 0.0, 0.0, period);
}

double ColorNormalization::normalize(double z) const {
    if (mode_ == Mode::PERIODIC) {
        double t = std::fmod(z / period_, 1.0);
        if (t < 0.0) {
            t += 1.0;
        }
        // -tiny + 1.0 can round up to exactly 1.0
        return t >= 1.0 ? 0.0 : t;
    }

    const double span = zmax_ - zmin_;
    if (span == 0.0) {
        return 0.5;
    }
    return std::clamp((z - zmin_) / span, 0.0, 1.0);
}

std::string ColorNormalization::toString() const {
    std::stringstream ss;
    if (mode_ == Mode::PERIODIC) {
        ss << "periodic (period " << period_ << ")";
    } else {
        ss << "clamped [" << zmin_ << ", " << zmax_ << "]";
    }
    return ss.str();
}

ColorNormalization::Mode parseColorMode(const std::string& name) {
    if (name == "clamped") {
        return ColorNormalization::Mode::CLAMPED;
    }
    if (name == "periodic") {
        return ColorNormalization::Mode::PERIODIC;
    }
    PHASECLOUD_THROW(core::ConfigException,
                     "Unknown colour mode '" + name + "' (expected clamped or periodic)");
}

std::string colorModeToString(ColorNormalization::Mode mode) {
    return mode == ColorNormalization::Mode::PERIODIC ? "periodic" : "clamped";
}

DepthColorMapper::DepthColorMapper(const ColorRamp& ramp, const ColorNormalization& normalization)
    : ramp_(ramp)
    , normalization_(normalization) {}

cv::Vec3b DepthColorMapper::colorFor(double z) const {
    return ramp_.eval(normalization_.normalize(z));
}

std::vector<cv::Vec3b> DepthColorMapper::mapColors(const core::PointCloud& cloud) const {
    std::vector<cv::Vec3b> colors(cloud.size());
    const int n = static_cast<int>(cloud.size());

#ifdef _OPENMP
    #pragma omp parallel for
#endif
    for (int i = 0; i < n; ++i) {
        colors[static_cast<size_t>(i)] = colorFor(cloud.points[static_cast<size_t>(i)].z);
    }
    return colors;
}

std::vector<size_t> DepthColorMapper::depthOrder(const core::PointCloud& cloud,
                                                 const Projection& projection) const {
    const int n = static_cast<int>(cloud.size());
    std::vector<double> depths(cloud.size());

#ifdef _OPENMP
    #pragma omp parallel for
#endif
    for (int i = 0; i < n; ++i) {
        const core::PhasePoint& p = cloud.points[static_cast<size_t>(i)];
        depths[static_cast<size_t>(i)] = projection.depth(p.x, p.y, p.z);
    }

    std::vector<size_t> order(cloud.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(),
              [&depths](size_t lhs, size_t rhs) { return depths[lhs] < depths[rhs]; });
    return order;
}

std::vector<ColoredPoint> DepthColorMapper::colorize(core::PointCloud&& cloud,
                                                     const Projection* projection) const {
    core::PointCloud owned = std::move(cloud);
    std::vector<ColoredPoint> colored(owned.size());
    const int n = static_cast<int>(owned.size());

#ifdef _OPENMP
    #pragma omp parallel for
#endif
    for (int i = 0; i < n; ++i) {
        const core::PhasePoint& p = owned.points[static_cast<size_t>(i)];
        ColoredPoint& out = colored[static_cast<size_t>(i)];
        out.point = p;
        out.color = colorFor(p.z);
        out.depth = projection ? projection->depth(p.x, p.y, p.z) : 0.0;
    }

    if (projection) {
        std::sort(colored.begin(), colored.end(),
                  [](const ColoredPoint& lhs, const ColoredPoint& rhs) { return lhs.depth < rhs.depth; });
    }

    PHASECLOUD_LOG_DEBUG("DepthColorMapper") << "Coloured " << colored.size() << " points with "
                                             << ramp_.getName() << ", " << normalization_.toString()
                                             << (projection ? ", depth-sorted" : "");
    return colored;
}

uint32_t DepthColorMapper::packRgb(const cv::Vec3b& bgr) {
    return (static_cast<uint32_t>(bgr[2]) << 16) |
           (static_cast<uint32_t>(bgr[1]) << 8) |
           static_cast<uint32_t>(bgr[0]);
}

} // namespace render
} // namespace phasecloud
