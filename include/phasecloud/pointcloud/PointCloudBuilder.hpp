#pragma once

#include "phasecloud/core/types.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <string>

namespace phasecloud {
namespace pointcloud {

/**
 * @brief Quality-filtered flattening of the phase and quality fields
 *
 * Produces one point per pixel whose quality is strictly greater than the
 * threshold, in row-major scan order, with x = column, y = row, z = phase.
 */
class PointCloudBuilder {
public:
    struct Config {
        double qualityThreshold = 0.0;   ///< Points need quality > threshold
    };

    /**
     * @brief Build output
     *
     * minPhase/maxPhase are folded over retained points during the filtering
     * scan; both are NaN when no point is retained.
     */
    struct BuildResult {
        core::PointCloud cloud;
        double minPhase = 0.0;
        double maxPhase = 0.0;
        size_t rejectedCount = 0;
        int rows = 0;
        int cols = 0;

        std::string toString() const;
    };

    PointCloudBuilder() = default;
    explicit PointCloudBuilder(const Config& config) : config_(config) {}

    void setConfig(const Config& config) { config_ = config; }
    const Config& getConfig() const { return config_; }

    /**
     * @brief Filter and flatten the two co-registered fields
     *
     * @param phase Unwrapped phase (single channel, any depth)
     * @param quality Per-pixel confidence, same shape as phase
     * @throws ShapeMismatchException if the shapes differ
     * @throws InputException if either field is multi-channel
     */
    BuildResult build(const cv::Mat& phase, const cv::Mat& quality) const;

private:
    Config config_;
};

} // namespace pointcloud
} // namespace phasecloud
