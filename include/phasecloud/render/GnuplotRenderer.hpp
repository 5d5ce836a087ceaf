#pragma once

#include "phasecloud/render/Renderer.hpp"
#include <string>

namespace phasecloud {
namespace render {

/**
 * @brief Renders through an external gnuplot process
 *
 * Writes a point-data file (x, residual, y, packed RGB per line) and an
 * splot script to the temp directory, runs gnuplot on the script and removes
 * both files (and the captured tool output) afterwards, also on failure.
 * gnuplot does its own hidden-surface handling, so scene order is irrelevant.
 */
class GnuplotRenderer : public Renderer {
public:
    struct Config {
        std::string executable = "gnuplot";
        std::string terminal = "pngcairo";
        double pointSize = 0.3;
    };

    struct CommandResult {
        int exitStatus = 0;        ///< 127 when the shell could not find the program
        std::string output;        ///< Combined stdout and stderr
    };

    GnuplotRenderer();
    explicit GnuplotRenderer(const Config& config);

    std::string getName() const override { return "gnuplot"; }
    bool requiresDepthOrder() const override { return false; }

    /**
     * @throws RenderException (ERROR_EXTERNAL_TOOL) when gnuplot is missing or
     *         exits non-zero, (ERROR_RENDER_FAILURE) when no image was produced
     */
    void render(const RenderScene& scene, const std::string& outputPath) override;

    /**
     * @brief Write one "x residual y 0xRRGGBB" line per point
     */
    static void writeDataFile(const RenderScene& scene, const std::string& path);

    /**
     * @brief Generate the splot script plotting dataPath into outputPath
     */
    std::string buildScript(const RenderScene& scene,
                            const std::string& dataPath,
                            const std::string& outputPath) const;

    /**
     * @brief Run a shell command, capturing its combined output in captureFile
     */
    static CommandResult runCommand(const std::string& command, const std::string& captureFile);

    /// POSIX shell single-quoting
    static std::string shellQuote(const std::string& s);

    /// gnuplot single-quoted string literal
    static std::string gnuplotQuote(const std::string& s);

    const Config& getConfig() const { return config_; }

private:
    Config config_;
};

} // namespace render
} // namespace phasecloud
