/**
 * @file test_renderers.cpp
 * @brief Unit tests for the chart and gnuplot rendering backends
 *
 * Validates:
 * - Chart canvas size, background and point drawing
 * - imwrite failures become RenderException
 * - gnuplot data file columns and script generation
 * - Missing gnuplot executable is reported and temporary files are removed
 */

#include <gtest/gtest.h>
#include <phasecloud/render/ChartRenderer.hpp>
#include <phasecloud/render/GnuplotRenderer.hpp>
#include <phasecloud/render/RendererFactory.hpp>
#include <phasecloud/core/exception.h>
#include <phasecloud/core/Logger.hpp>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace phasecloud;
using render::ChartRenderer;
using render::GnuplotRenderer;
using render::RenderScene;

namespace fs = std::filesystem;

class RendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);
        dir_ = fs::temp_directory_path() / ("phasecloud_render_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);

        scene_.imageSize = cv::Size(320, 240);
        scene_.range.x = core::AxisRange(0.0, 10.0);
        scene_.range.y = core::AxisRange(8.0, 0.0);
        scene_.range.z = core::AxisRange(-0.5, 0.5);
        scene_.view.yaw = 0.0;
        scene_.view.pitch = 0.0;
        scene_.view.pointRadius = 3;

        render::ColoredPoint center;
        center.point = core::PhasePoint(5.0, 4.0, 0.0, 1.0);
        center.color = cv::Vec3b(0, 0, 255);
        render::ColoredPoint corner;
        corner.point = core::PhasePoint(0.0, 8.0, -0.25, 0.5);
        corner.color = cv::Vec3b(0x10, 0x20, 0x30);
        scene_.points = {corner, center};
    }

    void TearDown() override {
        fs::remove_all(dir_);
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static size_t countOwnTempFiles() {
        const std::string prefix = "phasecloud-" + std::to_string(::getpid()) + "-";
        size_t count = 0;
        for (const auto& entry : fs::directory_iterator(fs::temp_directory_path())) {
            if (entry.path().filename().string().rfind(prefix, 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    fs::path dir_;
    RenderScene scene_;
};

TEST_F(RendererTest, ChartDrawsPointsOnWhiteCanvas) {
    ChartRenderer renderer;
    EXPECT_EQ(renderer.getName(), "chart");
    EXPECT_TRUE(renderer.requiresDepthOrder());

    const cv::Mat canvas = renderer.draw(scene_);
    ASSERT_EQ(canvas.type(), CV_8UC3);
    EXPECT_EQ(canvas.cols, 320);
    EXPECT_EQ(canvas.rows, 240);

    EXPECT_EQ(canvas.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 255, 255));
    // The centre point lands on the image centre for a head-on view
    EXPECT_EQ(canvas.at<cv::Vec3b>(120, 160), cv::Vec3b(0, 0, 255));
}

TEST_F(RendererTest, ChartSkipsPointsOutsideRange) {
    scene_.points.resize(1);
    scene_.points[0].point = core::PhasePoint(5.0, 4.0, 3.0, 1.0);
    scene_.points[0].color = cv::Vec3b(0, 0, 255);

    const cv::Mat canvas = ChartRenderer().draw(scene_);
    EXPECT_NE(canvas.at<cv::Vec3b>(120, 160), cv::Vec3b(0, 0, 255));
}

TEST_F(RendererTest, ChartWritesImage) {
    const std::string output = (dir_ / "chart.png").string();
    ChartRenderer renderer;
    renderer.render(scene_, output);

    const cv::Mat written = cv::imread(output, cv::IMREAD_COLOR);
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(written.cols, 320);
    EXPECT_EQ(written.rows, 240);
}

TEST_F(RendererTest, ChartWriteFailureIsRenderError) {
    ChartRenderer renderer;
    try {
        renderer.render(scene_, (dir_ / "missing" / "chart.png").string());
        FAIL() << "Expected RenderException";
    } catch (const core::RenderException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_RENDER_FAILURE);
    }

    EXPECT_THROW(renderer.render(scene_, (dir_ / "chart.unknownformat").string()), core::RenderException);
}

TEST_F(RendererTest, GnuplotDataFileHasOnePointPerLine) {
    const std::string path = (dir_ / "points.dat").string();
    GnuplotRenderer::writeDataFile(scene_, path);

    std::istringstream lines(readFile(path));
    std::string first;
    std::string second;
    std::string extra;
    ASSERT_TRUE(std::getline(lines, first));
    ASSERT_TRUE(std::getline(lines, second));
    EXPECT_FALSE(std::getline(lines, extra));

    // x, residual, y, 0xRRGGBB
    EXPECT_EQ(first, "0 -0.25 8 0x302010");
    EXPECT_EQ(second, "5 0 4 0xff0000");
}

TEST_F(RendererTest, GnuplotScriptPlotsDataWithRanges) {
    GnuplotRenderer::Config config;
    config.terminal = "pngcairo";
    const GnuplotRenderer renderer(config);
    EXPECT_EQ(renderer.getName(), "gnuplot");
    EXPECT_FALSE(renderer.requiresDepthOrder());

    const std::string script = renderer.buildScript(scene_, "/tmp/data's.dat", "/out/residual.png");

    EXPECT_NE(script.find("set terminal pngcairo size 320,240"), std::string::npos) << script;
    EXPECT_NE(script.find("set output '/out/residual.png'"), std::string::npos) << script;
    EXPECT_NE(script.find("set xrange [0:10]"), std::string::npos) << script;
    EXPECT_NE(script.find("set yrange [-0.5:0.5]"), std::string::npos) << script;
    EXPECT_NE(script.find("set zrange [8:0]"), std::string::npos) << script;
    EXPECT_NE(script.find("splot '/tmp/data''s.dat' using 1:2:3:4"), std::string::npos) << script;
    EXPECT_NE(script.find("linecolor rgb variable"), std::string::npos) << script;
}

TEST_F(RendererTest, GnuplotWidensEmptyRanges) {
    scene_.range.z = core::AxisRange(2.0, 2.0);
    const std::string script = GnuplotRenderer().buildScript(scene_, "d.dat", "o.png");
    EXPECT_NE(script.find("set yrange [1.5:2.5]"), std::string::npos) << script;
}

TEST_F(RendererTest, QuotingEscapesSingleQuotes) {
    EXPECT_EQ(GnuplotRenderer::shellQuote("a b"), "'a b'");
    EXPECT_EQ(GnuplotRenderer::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(GnuplotRenderer::gnuplotQuote("it's"), "'it''s'");
}

TEST_F(RendererTest, RunCommandReportsExitStatusAndOutput) {
    const std::string capture = (dir_ / "capture.log").string();
    const auto ok = GnuplotRenderer::runCommand("echo hello", capture);
    EXPECT_EQ(ok.exitStatus, 0);
    EXPECT_EQ(ok.output, "hello\n");

    const auto failed = GnuplotRenderer::runCommand("sh -c 'echo oops 1>&2; exit 3'", capture);
    EXPECT_EQ(failed.exitStatus, 3);
    EXPECT_EQ(failed.output, "oops\n");
}

TEST_F(RendererTest, MissingGnuplotIsExternalToolErrorAndCleansUp) {
    GnuplotRenderer::Config config;
    config.executable = (dir_ / "no-such-gnuplot").string();
    GnuplotRenderer renderer(config);

    const size_t before = countOwnTempFiles();
    try {
        renderer.render(scene_, (dir_ / "out.png").string());
        FAIL() << "Expected RenderException";
    } catch (const core::RenderException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_EXTERNAL_TOOL);
        EXPECT_NE(e.getMessage().find("127"), std::string::npos) << e.getMessage();
    }
    EXPECT_EQ(countOwnTempFiles(), before);
    EXPECT_FALSE(fs::exists(dir_ / "out.png"));
}

TEST_F(RendererTest, FailingToolRelaysStatus) {
    // "false" ignores its arguments and exits 1
    GnuplotRenderer::Config config;
    config.executable = "false";
    GnuplotRenderer renderer(config);

    try {
        renderer.render(scene_, (dir_ / "out.png").string());
        FAIL() << "Expected RenderException";
    } catch (const core::RenderException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_EXTERNAL_TOOL);
        EXPECT_NE(e.getMessage().find("status 1"), std::string::npos) << e.getMessage();
    }
}

TEST_F(RendererTest, SilentToolWithoutImageIsRenderFailure) {
    // "true" succeeds without producing the image
    GnuplotRenderer::Config config;
    config.executable = "true";
    GnuplotRenderer renderer(config);

    try {
        renderer.render(scene_, (dir_ / "out.png").string());
        FAIL() << "Expected RenderException";
    } catch (const core::RenderException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_RENDER_FAILURE);
    }
}

TEST_F(RendererTest, FactorySelectsBackend) {
    render::RendererConfig config;
    EXPECT_EQ(render::createRenderer(config)->getName(), "chart");

    config.backend = render::Backend::GNUPLOT;
    EXPECT_EQ(render::createRenderer(config)->getName(), "gnuplot");

    EXPECT_EQ(render::parseBackend("gnuplot"), render::Backend::GNUPLOT);
    EXPECT_EQ(render::backendToString(render::Backend::CHART), "chart");
    EXPECT_THROW(render::parseBackend("svg"), core::ConfigException);
}
