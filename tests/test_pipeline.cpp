/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests of PhaseCloudPipeline with a capturing renderer
 *
 * Validates:
 * - Quality filtering, fit and residual on flat and rational fields
 * - Supplied coefficients bypass the fit and the coefficient report
 * - Axis ranges, mirroring and depth ordering of the rendered scene
 * - Error propagation for shape mismatch and too few points
 * - Loading .npy inputs from disk
 */

#include <gtest/gtest.h>
#include <phasecloud/api/PhaseCloudPipeline.hpp>
#include <phasecloud/core/exception.h>
#include <phasecloud/core/Logger.hpp>
#include <phasecloud/io/ArrayIO.hpp>
#include <phasecloud/render/Projection.hpp>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace phasecloud;
using api::PhaseCloudPipeline;
using api::PipelineConfig;

namespace {

/**
 * Records the last scene instead of drawing it
 */
class CapturingRenderer : public render::Renderer {
public:
    struct Capture {
        int calls = 0;
        std::string outputPath;
        render::RenderScene scene;
    };

    CapturingRenderer(std::shared_ptr<Capture> capture, bool depthOrder)
        : capture_(std::move(capture)), depthOrder_(depthOrder) {}

    std::string getName() const override { return "capture"; }
    bool requiresDepthOrder() const override { return depthOrder_; }

    void render(const render::RenderScene& scene, const std::string& outputPath) override {
        ++capture_->calls;
        capture_->outputPath = outputPath;
        capture_->scene = scene;
    }

private:
    std::shared_ptr<Capture> capture_;
    bool depthOrder_;
};

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);
        capture_ = std::make_shared<CapturingRenderer::Capture>();
    }

    void TearDown() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    PhaseCloudPipeline makePipeline(const PipelineConfig& config, bool depthOrder = true) {
        return PhaseCloudPipeline(config, std::make_unique<CapturingRenderer>(capture_, depthOrder));
    }

    static cv::Mat rationalField(int rows, int cols, const core::FitCoefficients& c) {
        cv::Mat field(rows, cols, CV_64F);
        for (int i = 0; i < rows; ++i) {
            for (int j = 0; j < cols; ++j) {
                field.at<double>(i, j) = c.evaluate(j, i);
            }
        }
        return field;
    }

    std::shared_ptr<CapturingRenderer::Capture> capture_;
};

TEST_F(PipelineTest, FlatFieldFitsConstantSurface) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(2.0));
    const cv::Mat quality(4, 4, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.threshold = 0.5;
    const auto result = makePipeline(config).process(phase, quality);

    EXPECT_TRUE(result.fitComputed);
    EXPECT_EQ(result.retainedCount, 16u);
    EXPECT_EQ(result.rejectedCount, 0u);
    EXPECT_NEAR(result.coefficients.a, 0.0, 1e-9);
    EXPECT_NEAR(result.coefficients.b, 0.0, 1e-9);
    EXPECT_NEAR(result.coefficients.c, 2.0, 1e-9);
    EXPECT_NEAR(result.coefficients.d, 0.0, 1e-9);
    EXPECT_NEAR(result.coefficients.e, 0.0, 1e-9);

    ASSERT_EQ(result.scene.points.size(), 16u);
    for (const auto& cp : result.scene.points) {
        EXPECT_NEAR(cp.point.z, 0.0, 1e-9);
    }
    EXPECT_NEAR(result.minResidual, 0.0, 1e-9);
    EXPECT_NEAR(result.maxResidual, 0.0, 1e-9);
}

TEST_F(PipelineTest, RecoversRationalSurface) {
    core::FitCoefficients truth;
    truth.a = 0.03;
    truth.b = -0.02;
    truth.c = 5.0;
    truth.d = 0.002;
    truth.e = 0.001;
    const cv::Mat phase = rationalField(15, 20, truth);
    const cv::Mat quality(15, 20, CV_64F, cv::Scalar(1.0));

    const auto result = makePipeline(PipelineConfig()).process(phase, quality);

    EXPECT_NEAR(result.coefficients.a, truth.a, 1e-8);
    EXPECT_NEAR(result.coefficients.b, truth.b, 1e-8);
    EXPECT_NEAR(result.coefficients.c, truth.c, 1e-7);
    EXPECT_NEAR(result.coefficients.d, truth.d, 1e-10);
    EXPECT_NEAR(result.coefficients.e, truth.e, 1e-10);
    EXPECT_LT(std::abs(result.minResidual), 1e-8);
    EXPECT_LT(std::abs(result.maxResidual), 1e-8);
}

TEST_F(PipelineTest, QualityThresholdIsStrict) {
    cv::Mat phase(3, 4, CV_64F, cv::Scalar(1.0));
    cv::Mat quality(3, 4, CV_64F, cv::Scalar(0.9));
    // Row 0 sits exactly on the threshold and is rejected
    quality.row(0).setTo(0.5);

    PipelineConfig config;
    config.threshold = 0.5;
    const auto result = makePipeline(config).process(phase, quality);

    EXPECT_EQ(result.retainedCount, 8u);
    EXPECT_EQ(result.rejectedCount, 4u);
    for (const auto& cp : result.scene.points) {
        EXPECT_GT(cp.point.y, 0.0);
    }
}

TEST_F(PipelineTest, ShapeMismatchIsInputError) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(1.0));
    const cv::Mat quality(4, 5, CV_64F, cv::Scalar(1.0));

    auto pipeline = makePipeline(PipelineConfig());
    try {
        pipeline.process(phase, quality);
        FAIL() << "Expected ShapeMismatchException";
    } catch (const core::ShapeMismatchException& e) {
        EXPECT_EQ(core::exitCodeFor(e.getResultCode()), 3);
    }
}

TEST_F(PipelineTest, TooFewPointsIsInsufficientData) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(1.0));
    cv::Mat quality(4, 4, CV_64F, cv::Scalar(0.0));
    quality.at<double>(0, 0) = 1.0;
    quality.at<double>(1, 1) = 1.0;
    quality.at<double>(2, 2) = 1.0;
    quality.at<double>(3, 3) = 1.0;

    auto pipeline = makePipeline(PipelineConfig());
    EXPECT_THROW(pipeline.process(phase, quality), core::InsufficientDataException);
    EXPECT_EQ(capture_->calls, 0);
}

TEST_F(PipelineTest, SuppliedCoefficientsSkipFit) {
    // Three points would be too few to fit
    const cv::Mat phase(1, 3, CV_64F, cv::Scalar(2.5));
    const cv::Mat quality(1, 3, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 2.0, 0.0, 0.0};
    const auto result = makePipeline(config).process(phase, quality);

    EXPECT_FALSE(result.fitComputed);
    EXPECT_DOUBLE_EQ(result.coefficients.c, 2.0);
    ASSERT_EQ(result.scene.points.size(), 3u);
    for (const auto& cp : result.scene.points) {
        EXPECT_DOUBLE_EQ(cp.point.z, 0.5);
    }
}

TEST_F(PipelineTest, PointsOnPolesAreDropped) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(1.0));
    const cv::Mat quality(4, 4, CV_64F, cv::Scalar(1.0));

    // Denominator 1 - x vanishes on column x = 1
    PipelineConfig config;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 2.0, -1.0, 0.0};
    const auto result = makePipeline(config).process(phase, quality);

    EXPECT_EQ(result.droppedCount, 4u);
    EXPECT_EQ(result.scene.points.size(), 12u);
    for (const auto& cp : result.scene.points) {
        EXPECT_NE(cp.point.x, 1.0);
        EXPECT_TRUE(std::isfinite(cp.point.z));
    }
}

TEST_F(PipelineTest, CenterRemovesMeanResidual) {
    cv::Mat phase(2, 4, CV_64F, cv::Scalar(2.0));
    phase.at<double>(0, 0) = 3.0;
    const cv::Mat quality(2, 4, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.center = true;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 2.0, 0.0, 0.0};
    const auto result = makePipeline(config).process(phase, quality);

    EXPECT_DOUBLE_EQ(result.meanResidual, 0.125);
    EXPECT_DOUBLE_EQ(result.minResidual, -0.125);
    EXPECT_DOUBLE_EQ(result.maxResidual, 0.875);

    double sum = 0.0;
    for (const auto& cp : result.scene.points) {
        sum += cp.point.z;
    }
    EXPECT_NEAR(sum, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(result.scene.range.z.start, -0.125);
    EXPECT_DOUBLE_EQ(result.scene.range.z.end, 0.875);
}

TEST_F(PipelineTest, PeriodicModeWrapsColours) {
    cv::Mat phase(1, 6, CV_64F, cv::Scalar(0.25));
    phase.at<double>(0, 5) = 1.25;
    const cv::Mat quality(1, 6, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.colorMode = render::ColorNormalization::Mode::PERIODIC;
    config.colorPeriod = 1.0;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 0.0, 0.0, 0.0};
    const auto result = makePipeline(config, false).process(phase, quality);

    ASSERT_EQ(result.scene.points.size(), 6u);
    EXPECT_EQ(result.scene.points[0].color, result.scene.points[5].color);
}

TEST_F(PipelineTest, ComputeRangeDefaults) {
    PipelineConfig config;
    core::RenderRange range = PhaseCloudPipeline::computeRange(config, 480, 640, -0.2, 0.3);
    EXPECT_DOUBLE_EQ(range.x.start, 0.0);
    EXPECT_DOUBLE_EQ(range.x.end, 640.0);
    EXPECT_DOUBLE_EQ(range.y.start, 480.0);
    EXPECT_DOUBLE_EQ(range.y.end, 0.0);
    EXPECT_DOUBLE_EQ(range.z.start, -0.2);
    EXPECT_DOUBLE_EQ(range.z.end, 0.3);

    config.mirror = true;
    config.zRange = core::AxisRange(-1.0, 1.0);
    range = PhaseCloudPipeline::computeRange(config, 480, 640, -0.2, 0.3);
    EXPECT_DOUBLE_EQ(range.x.start, 640.0);
    EXPECT_DOUBLE_EQ(range.x.end, 0.0);
    EXPECT_DOUBLE_EQ(range.z.start, -1.0);
    EXPECT_DOUBLE_EQ(range.z.end, 1.0);

    // Empty residual cloud
    config.zRange.reset();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    range = PhaseCloudPipeline::computeRange(config, 4, 4, nan, nan);
    EXPECT_DOUBLE_EQ(range.z.start, 0.0);
    EXPECT_DOUBLE_EQ(range.z.end, 1.0);
}

TEST_F(PipelineTest, SceneIsDepthSortedWhenRendererNeedsIt) {
    core::FitCoefficients surface;
    surface.a = 0.1;
    surface.b = 0.05;
    const cv::Mat phase = rationalField(6, 8, surface);
    cv::Mat noisy = phase.clone();
    noisy.at<double>(2, 3) += 0.4;
    const cv::Mat quality(6, 8, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.fitCoefficients = surface.toVector();
    const auto result = makePipeline(config, true).process(noisy, quality);

    const render::Projection projection(result.scene.range, result.scene.imageSize, result.scene.view);
    ASSERT_EQ(result.scene.points.size(), 48u);
    for (size_t i = 1; i < result.scene.points.size(); ++i) {
        const auto& prev = result.scene.points[i - 1].point;
        const auto& cur = result.scene.points[i].point;
        EXPECT_LE(projection.depth(prev.x, prev.y, prev.z), projection.depth(cur.x, cur.y, cur.z));
    }
}

TEST_F(PipelineTest, SceneKeepsRowMajorOrderOtherwise) {
    const cv::Mat phase(3, 4, CV_64F, cv::Scalar(1.0));
    const cv::Mat quality(3, 4, CV_64F, cv::Scalar(1.0));

    PipelineConfig config;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 1.0, 0.0, 0.0};
    const auto result = makePipeline(config, false).process(phase, quality);

    ASSERT_EQ(result.scene.points.size(), 12u);
    for (size_t k = 0; k < result.scene.points.size(); ++k) {
        EXPECT_DOUBLE_EQ(result.scene.points[k].point.x, static_cast<double>(k % 4));
        EXPECT_DOUBLE_EQ(result.scene.points[k].point.y, static_cast<double>(k / 4));
    }
}

TEST_F(PipelineTest, PrintCoefficientsFormat) {
    core::FitCoefficients c;
    c.a = 1.5;
    c.b = -2.0;
    c.c = 0.25;
    c.d = 0.0;
    c.e = 1e-5;

    std::ostringstream os;
    PhaseCloudPipeline::printCoefficients(os, c);
    EXPECT_EQ(os.str(), "a = 1.5\nb = -2\nc = 0.25\nd = 0\ne = 1e-05\n");
}

TEST_F(PipelineTest, RunReportsComputedCoefficientsAndRenders) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(2.0));
    const cv::Mat quality(4, 4, CV_64F, cv::Scalar(1.0));
    auto pipeline = makePipeline(PipelineConfig());

    testing::internal::CaptureStdout();
    const auto result = pipeline.run(phase, quality, "residual.png");
    const std::string printed = testing::internal::GetCapturedStdout();

    EXPECT_NE(printed.find("a = "), std::string::npos);
    EXPECT_NE(printed.find("e = "), std::string::npos);
    EXPECT_EQ(capture_->calls, 1);
    EXPECT_EQ(capture_->outputPath, "residual.png");
    EXPECT_EQ(capture_->scene.points.size(), result.scene.points.size());
    EXPECT_EQ(capture_->scene.imageSize, cv::Size(640, 480));
}

TEST_F(PipelineTest, RunWithSuppliedCoefficientsPrintsNothing) {
    const cv::Mat phase(4, 4, CV_64F, cv::Scalar(2.0));
    const cv::Mat quality(4, 4, CV_64F, cv::Scalar(1.0));
    PipelineConfig config;
    config.fitCoefficients = std::vector<double>{0.0, 0.0, 2.0, 0.0, 0.0};
    auto pipeline = makePipeline(config);

    testing::internal::CaptureStdout();
    pipeline.run(phase, quality, "residual.png");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
    EXPECT_EQ(capture_->calls, 1);
}

TEST_F(PipelineTest, RunFromNpyFiles) {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("phasecloud_pipeline_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const std::string phasePath = (dir / "phase.npy").string();
    const std::string qualityPath = (dir / "quality.npy").string();

    core::FitCoefficients truth;
    truth.a = 0.01;
    truth.c = 3.0;
    truth.d = 0.001;
    io::ArrayIO::saveNpy(phasePath, rationalField(8, 10, truth));
    io::ArrayIO::saveNpy(qualityPath, cv::Mat(8, 10, CV_64F, cv::Scalar(1.0)));

    PipelineConfig config;
    config.dimensions = cv::Size(200, 100);
    auto pipeline = makePipeline(config);

    testing::internal::CaptureStdout();
    const auto result = pipeline.runFromFiles(phasePath, qualityPath, "out.png");
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(result.retainedCount, 80u);
    EXPECT_NEAR(result.coefficients.c, 3.0, 1e-8);
    EXPECT_EQ(capture_->scene.imageSize, cv::Size(200, 100));

    EXPECT_THROW(pipeline.runFromFiles((dir / "missing.npy").string(), qualityPath, "out.png"),
                 core::InputException);

    std::filesystem::remove_all(dir);
}

TEST_F(PipelineTest, RejectsInvalidConstruction) {
    EXPECT_THROW(PhaseCloudPipeline(PipelineConfig(), nullptr), core::ConfigException);

    PipelineConfig config;
    config.colorPeriod = -1.0;
    EXPECT_THROW(makePipeline(config), core::ConfigException);
}

TEST_F(PipelineTest, DefaultRendererFollowsBackend) {
    PipelineConfig config;
    EXPECT_EQ(PhaseCloudPipeline(config).getRenderer().getName(), "chart");

    config.renderer.backend = render::Backend::GNUPLOT;
    EXPECT_EQ(PhaseCloudPipeline(config).getRenderer().getName(), "gnuplot");
}
