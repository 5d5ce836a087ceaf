#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace phasecloud {
namespace render {

/**
 * @brief Continuous map from [0, 1] to a colour
 *
 * Backed by a 256-entry table with linear interpolation between entries.
 * Colours are BGR, as everywhere else in OpenCV. A cyclic ramp wraps t into
 * [0, 1) and interpolates across the last/first entry, so t and t + 1 agree.
 */
class ColorRamp {
public:
    static constexpr int TABLE_SIZE = 256;

    /**
     * @brief Perceptually-uniform sequential ramp (cv::COLORMAP_VIRIDIS)
     */
    static ColorRamp viridis();

    /**
     * @brief Cyclic rainbow: the full HSV hue wheel at full saturation and value
     */
    static ColorRamp rainbow();

    /**
     * @brief Sequential ramp sampled from one of OpenCV's built-in colour maps
     * @param colormap cv::ColormapTypes value
     */
    static ColorRamp fromColormap(int colormap, const std::string& name);

    /**
     * @brief Colour at t; non-finite t is treated as 0
     */
    cv::Vec3b eval(double t) const;

    bool isCyclic() const { return cyclic_; }
    const std::string& getName() const { return name_; }

private:
    ColorRamp(std::vector<cv::Vec3b> table, bool cyclic, std::string name);

    std::vector<cv::Vec3b> table_;
    bool cyclic_;
    std::string name_;
};

} // namespace render
} // namespace phasecloud
