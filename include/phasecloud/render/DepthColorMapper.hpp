#pragma once

#include "phasecloud/core/types.hpp"
#include "phasecloud/render/ColorRamp.hpp"
#include "phasecloud/render/Projection.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace phasecloud {
namespace render {

/**
 * @brief Value to [0, 1) policy applied before the colour ramp
 */
class ColorNormalization {
public:
    enum class Mode {
        CLAMPED,     ///< t = (z - zmin) / (zmax - zmin), clamped to [0, 1]
        PERIODIC     ///< t = (z / period) mod 1, Euclidean
    };

    /**
     * @brief Range-clamped normalization; zmin > zmax reverses the ramp
     */
    static ColorNormalization clamped(double zmin, double zmax);

    /**
     * @throws ConfigException when period is not a positive finite number
     */
    static ColorNormalization periodic(double period);

    double normalize(double z) const;

    Mode getMode() const { return mode_; }
    double getMin() const { return zmin_; }
    double getMax() const { return zmax_; }
    double getPeriod() const { return period_; }

    std::string toString() const;

private:
    ColorNormalization(Mode mode, double zmin, double zmax, double period)
        : mode_(mode), zmin_(zmin), zmax_(zmax), period_(period) {}

    Mode mode_;
    double zmin_;
    double zmax_;
    double period_;
};

/**
 * @brief Parse "clamped" or "periodic"
 * @throws ConfigException for any other name
 */
ColorNormalization::Mode parseColorMode(const std::string& name);

std::string colorModeToString(ColorNormalization::Mode mode);

/**
 * @brief Point with its display colour and projected depth
 */
struct ColoredPoint {
    core::PhasePoint point;
    cv::Vec3b color;           ///< BGR
    double depth = 0.0;        ///< Projected depth, 0 without a projection
};

/**
 * @brief Colours points by residual and orders them for painter's-algorithm drawing
 */
class DepthColorMapper {
public:
    DepthColorMapper(const ColorRamp& ramp, const ColorNormalization& normalization);

    cv::Vec3b colorFor(double z) const;

    /**
     * @brief One colour per point, parallel to cloud.points
     */
    std::vector<cv::Vec3b> mapColors(const core::PointCloud& cloud) const;

    /**
     * @brief Indices into cloud.points sorted by ascending projected depth (farther first)
     */
    std::vector<size_t> depthOrder(const core::PointCloud& cloud, const Projection& projection) const;

    /**
     * @brief Colour every point and, given a projection, sort by ascending depth
     *
     * Consumes the cloud. Without a projection the input order is kept.
     */
    std::vector<ColoredPoint> colorize(core::PointCloud&& cloud, const Projection* projection) const;

    const ColorRamp& getRamp() const { return ramp_; }
    const ColorNormalization& getNormalization() const { return normalization_; }

    /**
     * @brief 0xRRGGBB packing of a BGR colour
     */
    static uint32_t packRgb(const cv::Vec3b& bgr);

private:
    ColorRamp ramp_;
    ColorNormalization normalization_;
};

} // namespace render
} // namespace phasecloud
