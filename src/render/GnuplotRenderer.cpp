#include "phasecloud/render/GnuplotRenderer.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace phasecloud {
namespace render {

namespace {

const char* const kComponent = "GnuplotRenderer";
constexpr double kPi = 3.14159265358979323846;

/**
 * Removes the listed files when leaving scope
 */
class TempFileGuard {
public:
    explicit TempFileGuard(std::vector<fs::path> paths) : paths_(std::move(paths)) {}

    ~TempFileGuard() {
        for (const fs::path& path : paths_) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                PHASECLOUD_LOG_WARNING(kComponent) << "Cannot remove temporary file "
                                                   << path.string() << ": " << ec.message();
            }
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

private:
    std::vector<fs::path> paths_;
};

fs::path tempPath(const std::string& stem, const std::string& extension) {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir / ("phasecloud-" + std::to_string(::getpid()) + "-" +
                  std::to_string(counter++) + "-" + stem + extension);
}

/// gnuplot warns and widens an empty range; do it here so the view is predictable
core::AxisRange plotRange(const core::AxisRange& range) {
    if (range.span() == 0.0) {
        return core::AxisRange(range.start - 0.5, range.end + 0.5);
    }
    return range;
}

void writeTextFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_RENDER_FAILURE,
                              "Cannot create " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_RENDER_FAILURE,
                              "Cannot write " + path.string());
    }
}

} // namespace

GnuplotRenderer::GnuplotRenderer() = default;

GnuplotRenderer::GnuplotRenderer(const Config& config) : config_(config) {}

std::string GnuplotRenderer::shellQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string GnuplotRenderer::gnuplotQuote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

void GnuplotRenderer::writeDataFile(const RenderScene& scene, const std::string& path) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(10);
    for (const ColoredPoint& cp : scene.points) {
        ss << cp.point.x << ' ' << cp.point.z << ' ' << cp.point.y << ' '
           << "0x" << std::hex << std::setw(6) << std::setfill('0')
           << DepthColorMapper::packRgb(cp.color)
           << std::dec << std::setfill(' ') << '\n';
    }
    writeTextFile(path, ss.str());
}

std::string GnuplotRenderer::buildScript(const RenderScene& scene,
                                         const std::string& dataPath,
                                         const std::string& outputPath) const {
    // Data x horizontal, residual into the view, data y vertical
    const core::AxisRange xRange = plotRange(scene.range.x);
    const core::AxisRange depthRange = plotRange(scene.range.z);
    const core::AxisRange verticalRange = plotRange(scene.range.y);

    // gnuplot's view is (rotation about screen x, rotation about screen z) in degrees
    const double rotX = 90.0 - scene.view.pitch * 180.0 / kPi;
    double rotZ = std::fmod(scene.view.yaw * 180.0 / kPi, 360.0);
    if (rotZ < 0.0) {
        rotZ += 360.0;
    }

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(10);
    ss << "set terminal " << config_.terminal << " size " << scene.imageSize.width << ","
       << scene.imageSize.height << " background rgb 'white'\n";
    ss << "set output " << gnuplotQuote(outputPath) << "\n";
    ss << "unset key\n";
    ss << "set xlabel 'x'\n";
    ss << "set ylabel 'residual'\n";
    ss << "set zlabel 'y'\n";
    ss << "set grid\n";
    ss << "set xyplane 0\n";
    ss << "set view " << rotX << ", " << rotZ << ", " << scene.view.scale << "\n";
    ss << "set xrange [" << xRange.start << ":" << xRange.end << "]\n";
    ss << "set yrange [" << depthRange.start << ":" << depthRange.end << "]\n";
    ss << "set zrange [" << verticalRange.start << ":" << verticalRange.end << "]\n";
    ss << "splot " << gnuplotQuote(dataPath)
       << " using 1:2:3:4 with points pointtype 7 pointsize " << config_.pointSize
       << " linecolor rgb variable\n";
    return ss.str();
}

GnuplotRenderer::CommandResult GnuplotRenderer::runCommand(const std::string& command,
                                                           const std::string& captureFile) {
    const std::string full = command + " > " + shellQuote(captureFile) + " 2>&1";
    PHASECLOUD_LOG_DEBUG(kComponent) << "Running: " << full;

    const int ret = std::system(full.c_str());
    if (ret == -1) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_EXTERNAL_TOOL,
                              "Cannot start a shell to run: " + command);
    }

    CommandResult result;
    if (WIFEXITED(ret)) {
        result.exitStatus = WEXITSTATUS(ret);
    } else if (WIFSIGNALED(ret)) {
        result.exitStatus = 128 + WTERMSIG(ret);
    } else {
        result.exitStatus = ret;
    }

    std::ifstream in(captureFile);
    if (in) {
        std::stringstream content;
        content << in.rdbuf();
        result.output = content.str();
    }
    return result;
}

void GnuplotRenderer::render(const RenderScene& scene, const std::string& outputPath) {
    const fs::path dataPath = tempPath("points", ".dat");
    const fs::path scriptPath = tempPath("plot", ".gp");
    const fs::path capturePath = tempPath("gnuplot", ".log");
    TempFileGuard guard({dataPath, scriptPath, capturePath});

    writeDataFile(scene, dataPath.string());
    writeTextFile(scriptPath, buildScript(scene, dataPath.string(), outputPath));

    // Stale output would otherwise pass the existence check below
    std::error_code ec;
    fs::remove(outputPath, ec);
    if (ec) {
        PHASECLOUD_LOG_WARNING(kComponent) << "Cannot remove existing " << outputPath << ": " << ec.message();
    }

    const std::string command = shellQuote(config_.executable) + " " + shellQuote(scriptPath.string());
    const CommandResult result = runCommand(command, capturePath.string());

    if (!result.output.empty()) {
        PHASECLOUD_LOG_DEBUG(kComponent) << config_.executable << " output:\n" << result.output;
    }

    if (result.exitStatus == 127) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_EXTERNAL_TOOL,
                              "Plotting tool '" + config_.executable + "' not found (exit status 127): " +
                              result.output);
    }
    if (result.exitStatus != 0) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_EXTERNAL_TOOL,
                              "'" + config_.executable + "' exited with status " +
                              std::to_string(result.exitStatus) + ": " + result.output);
    }
    if (!fs::exists(outputPath)) {
        PHASECLOUD_THROW_CODE(core::RenderException, core::ResultCode::ERROR_RENDER_FAILURE,
                              "'" + config_.executable + "' produced no image at " + outputPath +
                              (result.output.empty() ? "" : ": " + result.output));
    }

    PHASECLOUD_LOG_INFO(kComponent) << "Rendered " << scene.points.size() << " points to "
                                    << outputPath << " via " << config_.executable;
}

} // namespace render
} // namespace phasecloud
