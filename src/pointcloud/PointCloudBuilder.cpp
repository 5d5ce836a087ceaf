#include "phasecloud/pointcloud/PointCloudBuilder.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace phasecloud {
namespace pointcloud {

namespace {

std::string shapeString(const cv::Mat& m) {
    return std::to_string(m.rows) + "x" + std::to_string(m.cols);
}

} // namespace

std::string PointCloudBuilder::BuildResult::toString() const {
    std::stringstream ss;
    ss << "Point cloud: " << cloud.size() << " retained, " << rejectedCount
       << " rejected of " << rows << "x" << cols;
    if (!cloud.empty()) {
        ss << ", phase range [" << minPhase << ", " << maxPhase << "]";
    }
    return ss.str();
}

PointCloudBuilder::BuildResult PointCloudBuilder::build(const cv::Mat& phase,
                                                        const cv::Mat& quality) const {
    if (phase.rows != quality.rows || phase.cols != quality.cols) {
        PHASECLOUD_THROW(core::ShapeMismatchException,
                         "Phase field is " + shapeString(phase) +
                         " but quality field is " + shapeString(quality));
    }
    if (phase.channels() != 1 || quality.channels() != 1) {
        PHASECLOUD_THROW_CODE(core::InputException, core::ResultCode::ERROR_UNSUPPORTED_FORMAT,
                              "Phase and quality fields must be single-channel");
    }

    cv::Mat phase64;
    cv::Mat quality64;
    phase.convertTo(phase64, CV_64F);
    quality.convertTo(quality64, CV_64F);

    BuildResult result;
    result.rows = phase.rows;
    result.cols = phase.cols;
    result.minPhase = std::numeric_limits<double>::infinity();
    result.maxPhase = -std::numeric_limits<double>::infinity();
    result.cloud.points.reserve(phase64.total());

    const double threshold = config_.qualityThreshold;

    // Single row-major scan: filter and fold the phase extrema together
    for (int i = 0; i < phase64.rows; ++i) {
        const double* phaseRow = phase64.ptr<double>(i);
        const double* qualityRow = quality64.ptr<double>(i);
        for (int j = 0; j < phase64.cols; ++j) {
            const double q = qualityRow[j];
            const double z = phaseRow[j];
            if (!(q > threshold) || !std::isfinite(z)) {
                ++result.rejectedCount;
                continue;
            }
            result.cloud.points.emplace_back(static_cast<double>(j), static_cast<double>(i), z, q);
            result.minPhase = std::min(result.minPhase, z);
            result.maxPhase = std::max(result.maxPhase, z);
        }
    }

    if (result.cloud.empty()) {
        result.minPhase = std::numeric_limits<double>::quiet_NaN();
        result.maxPhase = std::numeric_limits<double>::quiet_NaN();
    }

    PHASECLOUD_LOG_DEBUG("PointCloudBuilder") << result.toString()
                                              << " (threshold " << threshold << ")";
    return result;
}

} // namespace pointcloud
} // namespace phasecloud
