#include "phasecloud/render/ColorRamp.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace phasecloud {
namespace render {

ColorRamp::ColorRamp(std::vector<cv::Vec3b> table, bool cyclic, std::string name)
    : table_(std::move(table))
    , cyclic_(cyclic)
    , name_(std::move(name)) {}

ColorRamp ColorRamp::viridis() {
    return fromColormap(cv::COLORMAP_VIRIDIS, "viridis");
}

ColorRamp ColorRamp::fromColormap(int colormap, const std::string& name) {
    cv::Mat ramp(1, TABLE_SIZE, CV_8UC1);
    for (int i = 0; i < TABLE_SIZE; ++i) {
        ramp.at<uchar>(0, i) = static_cast<uchar>(i);
    }

    cv::Mat colored;
    cv::applyColorMap(ramp, colored, colormap);

    std::vector<cv::Vec3b> table(TABLE_SIZE);
    for (int i = 0; i < TABLE_SIZE; ++i) {
        table[i] = colored.at<cv::Vec3b>(0, i);
    }
    return ColorRamp(std::move(table), false, name);
}

ColorRamp ColorRamp::rainbow() {
    // Hue in degrees for CV_32F HSV input
    cv::Mat hsv(1, TABLE_SIZE, CV_32FC3);
    for (int i = 0; i < TABLE_SIZE; ++i) {
        hsv.at<cv::Vec3f>(0, i) = cv::Vec3f(360.0f * static_cast<float>(i) / TABLE_SIZE, 1.0f, 1.0f);
    }

    cv::Mat bgr;
    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
    cv::Mat bgr8;
    bgr.convertTo(bgr8, CV_8UC3, 255.0);

    std::vector<cv::Vec3b> table(TABLE_SIZE);
    for (int i = 0; i < TABLE_SIZE; ++i) {
        table[i] = bgr8.at<cv::Vec3b>(0, i);
    }
    return ColorRamp(std::move(table), true, "rainbow");
}

cv::Vec3b ColorRamp::eval(double t) const {
    if (!std::isfinite(t)) {
        t = 0.0;
    }

    const int n = static_cast<int>(table_.size());
    size_t i0 = 0;
    size_t i1 = 0;
    double frac = 0.0;

    if (cyclic_) {
        t -= std::floor(t);
        const double pos = t * n;
        const int base = std::min(static_cast<int>(pos), n - 1);
        frac = pos - base;
        i0 = static_cast<size_t>(base);
        i1 = static_cast<size_t>((base + 1) % n);
    } else {
        t = std::clamp(t, 0.0, 1.0);
        const double pos = t * (n - 1);
        const int base = std::min(static_cast<int>(pos), n - 2);
        frac = pos - base;
        i0 = static_cast<size_t>(base);
        i1 = i0 + 1;
    }

    const cv::Vec3b& c0 = table_[i0];
    const cv::Vec3b& c1 = table_[i1];
    cv::Vec3b out;
    for (int ch = 0; ch < 3; ++ch) {
        out[ch] = cv::saturate_cast<uchar>(c0[ch] + (c1[ch] - c0[ch]) * frac);
    }
    return out;
}

} // namespace render
} // namespace phasecloud
