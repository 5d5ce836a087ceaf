/**
 * @file test_point_cloud_builder.cpp
 * @brief Unit tests for PointCloudBuilder
 */

#include <gtest/gtest.h>
#include <phasecloud/pointcloud/PointCloudBuilder.hpp>
#include <phasecloud/core/exception.h>
#include <phasecloud/core/Logger.hpp>
#include <opencv2/core.hpp>
#include <cmath>
#include <limits>

using namespace phasecloud;
using pointcloud::PointCloudBuilder;

class PointCloudBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);

        phase_ = (cv::Mat_<double>(3, 4) <<
                  1.0, 2.0, 3.0, 4.0,
                  5.0, 6.0, 7.0, 8.0,
                  9.0, 10.0, 11.0, 12.0);
        quality_ = (cv::Mat_<double>(3, 4) <<
                    0.9, 0.1, 0.5, 0.8,
                    0.0, 0.7, 0.6, 0.2,
                    0.51, 0.3, 0.4, 0.95);
    }

    cv::Mat phase_;
    cv::Mat quality_;
};

TEST_F(PointCloudBuilderTest, KeepsStrictlyAboveThresholdInRowMajorOrder) {
    PointCloudBuilder::Config config;
    config.qualityThreshold = 0.5;
    const auto result = PointCloudBuilder(config).build(phase_, quality_);

    // quality == 0.5 at (0, 2) is rejected
    const double expected[][4] = {
        {0, 0, 1.0, 0.9},
        {3, 0, 4.0, 0.8},
        {1, 1, 6.0, 0.7},
        {2, 1, 7.0, 0.6},
        {0, 2, 9.0, 0.51},
        {3, 2, 12.0, 0.95},
    };

    ASSERT_EQ(result.cloud.size(), 6u);
    for (size_t i = 0; i < result.cloud.size(); ++i) {
        const core::PhasePoint& p = result.cloud.points[i];
        EXPECT_DOUBLE_EQ(p.x, expected[i][0]) << "point " << i;
        EXPECT_DOUBLE_EQ(p.y, expected[i][1]) << "point " << i;
        EXPECT_DOUBLE_EQ(p.z, expected[i][2]) << "point " << i;
        EXPECT_DOUBLE_EQ(p.quality, expected[i][3]) << "point " << i;
    }
    EXPECT_EQ(result.rejectedCount, 6u);
    EXPECT_EQ(result.rows, 3);
    EXPECT_EQ(result.cols, 4);
}

TEST_F(PointCloudBuilderTest, PhaseExtremaCoverRetainedPointsOnly) {
    PointCloudBuilder::Config config;
    config.qualityThreshold = 0.55;
    const auto result = PointCloudBuilder(config).build(phase_, quality_);

    // Retained phases: 1, 4, 6, 7, 12
    EXPECT_DOUBLE_EQ(result.minPhase, 1.0);
    EXPECT_DOUBLE_EQ(result.maxPhase, 12.0);

    config.qualityThreshold = 0.65;
    const auto narrower = PointCloudBuilder(config).build(phase_, quality_);
    // Retained phases: 1, 4, 6, 12
    EXPECT_EQ(narrower.cloud.size(), 4u);
    EXPECT_DOUBLE_EQ(narrower.minPhase, 1.0);
    EXPECT_DOUBLE_EQ(narrower.maxPhase, 12.0);

    phase_.at<double>(0, 0) = 100.0;
    const auto shifted = PointCloudBuilder(config).build(phase_, quality_);
    EXPECT_DOUBLE_EQ(shifted.minPhase, 4.0);
    EXPECT_DOUBLE_EQ(shifted.maxPhase, 100.0);
}

TEST_F(PointCloudBuilderTest, ShapeMismatchThrowsBeforeBuilding) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(1.0));
    const cv::Mat quality(4, 5, CV_64F, cv::Scalar(1.0));

    EXPECT_THROW(PointCloudBuilder().build(phase, quality), core::ShapeMismatchException);
    try {
        PointCloudBuilder().build(phase, quality);
    } catch (const core::InputException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_SHAPE_MISMATCH);
        EXPECT_NE(e.getMessage().find("4x5"), std::string::npos);
    }
}

TEST_F(PointCloudBuilderTest, NonFinitePhaseIsRejected) {
    phase_.at<double>(0, 0) = std::numeric_limits<double>::quiet_NaN();
    phase_.at<double>(2, 3) = std::numeric_limits<double>::infinity();

    PointCloudBuilder::Config config;
    config.qualityThreshold = 0.5;
    const auto result = PointCloudBuilder(config).build(phase_, quality_);

    EXPECT_EQ(result.cloud.size(), 4u);
    EXPECT_EQ(result.rejectedCount, 8u);
    for (const auto& p : result.cloud.points) {
        EXPECT_TRUE(std::isfinite(p.z));
    }
    EXPECT_DOUBLE_EQ(result.minPhase, 4.0);
    EXPECT_DOUBLE_EQ(result.maxPhase, 9.0);
}

TEST_F(PointCloudBuilderTest, NothingRetainedGivesEmptyCloud) {
    PointCloudBuilder::Config config;
    config.qualityThreshold = 1.0;
    const auto result = PointCloudBuilder(config).build(phase_, quality_);

    EXPECT_TRUE(result.cloud.empty());
    EXPECT_EQ(result.rejectedCount, 12u);
    EXPECT_TRUE(std::isnan(result.minPhase));
    EXPECT_TRUE(std::isnan(result.maxPhase));
}

TEST_F(PointCloudBuilderTest, AcceptsSinglePrecisionInput) {
    cv::Mat phase32;
    cv::Mat quality8(3, 4, CV_8U, cv::Scalar(200));
    phase_.convertTo(phase32, CV_32F);

    PointCloudBuilder::Config config;
    config.qualityThreshold = 100.0;
    const auto result = PointCloudBuilder(config).build(phase32, quality8);

    ASSERT_EQ(result.cloud.size(), 12u);
    EXPECT_DOUBLE_EQ(result.cloud.points[5].z, 6.0);
    EXPECT_DOUBLE_EQ(result.cloud.points[5].quality, 200.0);
}

TEST_F(PointCloudBuilderTest, MultiChannelInputIsUnsupported) {
    const cv::Mat phase(3, 4, CV_64FC2, cv::Scalar(1.0, 2.0));
    try {
        PointCloudBuilder().build(phase, quality_);
        FAIL() << "Expected InputException";
    } catch (const core::InputException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_UNSUPPORTED_FORMAT);
    }
}
