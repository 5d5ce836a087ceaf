#include "phasecloud/api/PhaseCloudPipeline.hpp"
#include "phasecloud/cli/CommandLine.hpp"
#include "phasecloud/core/Logger.hpp"
#include "phasecloud/core/exception.h"

#include <iostream>
#include <exception>

using namespace phasecloud;

int main(int argc, char* argv[])
{
    auto& logger = core::Logger::getInstance();
    logger.setLevel(core::LogLevel::WARNING);

    const cli::CommandLine commandLine;

    try {
        const cli::CommandLineOptions options = commandLine.parse(argc, argv);
        if (options.helpRequested) {
            std::cout << commandLine.usage() << std::endl;
            return 0;
        }

        logger.setLevel(core::parseLogLevel(options.pipeline.logLevel));
        if (!options.pipeline.logFile.empty() && !logger.setLogFile(options.pipeline.logFile)) {
            std::cerr << "Warning: cannot open log file " << options.pipeline.logFile
                      << ", logging to console only" << std::endl;
        }

        logger.info("phasecloud " + options.unwrappedPath + " " + options.qualityPath +
                    " -> " + options.outputPath, "main");
        if (!options.configFile.empty()) {
            logger.info("Configuration file: " + options.configFile, "main");
        }

        api::PhaseCloudPipeline pipeline(options.pipeline);
        pipeline.runFromFiles(options.unwrappedPath, options.qualityPath, options.outputPath);

        logger.flush();
        return 0;

    } catch (const core::ConfigException& e) {
        logger.flush();
        std::cerr << "Error: " << e.getMessage() << "\n\n" << commandLine.usage() << std::endl;
        return core::exitCodeFor(e.getResultCode());

    } catch (const core::Exception& e) {
        logger.critical(e.what(), "main");
        logger.flush();
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return core::exitCodeFor(e.getResultCode());

    } catch (const std::exception& e) {
        logger.critical(std::string("Unexpected error: ") + e.what(), "main");
        logger.flush();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
