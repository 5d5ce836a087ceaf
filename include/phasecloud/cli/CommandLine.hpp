#pragma once

#include "phasecloud/api/PipelineConfig.hpp"
#include "phasecloud/core/Configuration.hpp"
#include "phasecloud/core/types.hpp"
#include <boost/program_options.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace phasecloud {
namespace cli {

/**
 * @brief Parsed invocation: three positional paths plus the pipeline options
 */
struct CommandLineOptions {
    bool helpRequested = false;
    std::string unwrappedPath;
    std::string qualityPath;
    std::string outputPath;
    std::string configFile;
    api::PipelineConfig pipeline;
};

/**
 * @brief phasecloud [options] UNWRAPPED QUALITY OUTPUT
 *
 * Values from --config FILE are applied first; options given on the command
 * line override them. Negative option values need the --name=value form,
 * e.g. --zlim=-1..1.
 */
class CommandLine {
public:
    CommandLine();

    /**
     * @throws ConfigException on unknown options, malformed values or a wrong
     *         number of positional arguments
     */
    CommandLineOptions parse(int argc, const char* const argv[]) const;

    /**
     * @param args Arguments without the program name
     */
    CommandLineOptions parse(const std::vector<std::string>& args) const;

    std::string usage() const;

    /**
     * @brief "WIDTHxHEIGHT" with two positive integers
     */
    static cv::Size parseDimensions(const std::string& text);

    /**
     * @brief "START..END" with two finite reals
     */
    static core::AxisRange parseRange(const std::string& text);

    /**
     * @brief Exactly five comma-separated reals a,b,c,d,e
     */
    static std::vector<double> parseCoefficients(const std::string& text);

    /**
     * @brief Copy every recognised key of a YAML configuration into config
     */
    static void applyConfiguration(const core::Configuration& configuration, api::PipelineConfig& config);

private:
    boost::program_options::options_description options_;
    boost::program_options::options_description hidden_;
    boost::program_options::positional_options_description positional_;
};

} // namespace cli
} // namespace phasecloud
