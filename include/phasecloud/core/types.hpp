/**
 * @file types.hpp
 * @brief Common type definitions for phasecloud
 *
 * Fundamental enums and value types shared by every pipeline stage.
 */

#ifndef PHASECLOUD_CORE_TYPES_HPP
#define PHASECLOUD_CORE_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace phasecloud {
namespace core {

/**
 * @brief Result codes for all phasecloud failures
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,     ///< Malformed option or configuration value
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_UNSUPPORTED_FORMAT,
    ERROR_SHAPE_MISMATCH,        ///< Phase and quality fields differ in shape
    ERROR_INSUFFICIENT_DATA,     ///< Fewer than five points survived the quality filter
    ERROR_FIT_DIVERGENCE,        ///< Least-squares solve failed numerically
    ERROR_RENDER_FAILURE,
    ERROR_EXTERNAL_TOOL          ///< External plotting tool missing or exited non-zero
};

/**
 * @brief Single sample of the phase field
 *
 * x and y are the pixel column and row, z is the unwrapped phase until the
 * residual stage replaces it with the residual depth.
 */
struct PhasePoint {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double quality = 0.0;

    PhasePoint() = default;
    PhasePoint(double px, double py, double pz, double q)
        : x(px), y(py), z(pz), quality(q) {}
};

/**
 * @brief Ordered point list owned by the stage currently transforming it
 */
struct PointCloud {
    std::vector<PhasePoint> points;

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    void clear() { points.clear(); }
};

/**
 * @brief Coefficients of z = (a*x + b*y + c) / (d*x + e*y + 1)
 */
struct FitCoefficients {
    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = 0.0;

    static constexpr size_t COUNT = 5;

    /**
     * @brief Evaluate the rational surface at (x, y)
     *
     * Returns a non-finite value at a pole of the surface.
     */
    double evaluate(double x, double y) const {
        return (a * x + b * y + c) / (d * x + e * y + 1.0);
    }

    std::vector<double> toVector() const { return {a, b, c, d, e}; }

    /**
     * @brief Build from exactly five values (a, b, c, d, e)
     * @throws ConfigException when values.size() != 5
     */
    static FitCoefficients fromVector(const std::vector<double>& values);

    std::string toString() const;
};

/**
 * @brief One axis range; start > end mirrors the axis
 */
struct AxisRange {
    double start = 0.0;
    double end = 1.0;

    AxisRange() = default;
    AxisRange(double s, double e) : start(s), end(e) {}

    bool isReversed() const { return start > end; }
    double span() const { return end - start; }
    AxisRange reversed() const { return AxisRange(end, start); }

    /**
     * @brief Position of value along the axis, 0 at start and 1 at end
     *
     * A zero-length range places every value at 0.5.
     */
    double normalize(double value) const {
        const double s = span();
        return s == 0.0 ? 0.5 : (value - start) / s;
    }
};

/**
 * @brief Axis ranges of the 3D view
 */
struct RenderRange {
    AxisRange x;
    AxisRange y;
    AxisRange z;
};

} // namespace core
} // namespace phasecloud

#endif // PHASECLOUD_CORE_TYPES_HPP
