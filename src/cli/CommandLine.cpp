#include "phasecloud/cli/CommandLine.hpp"
#include "phasecloud/core/exception.h"
#include "phasecloud/core/Logger.hpp"
#include <cctype>
#include <cmath>
#include <locale>
#include <set>
#include <sstream>

namespace po = boost::program_options;

namespace phasecloud {
namespace cli {

namespace {

const char* const kComponent = "CommandLine";

const std::set<std::string> kConfigKeys = {
    "dimensions", "zlim", "threshold", "mirror", "center", "color-mode", "color-period",
    "fit-coefficients", "backend", "yaw", "pitch", "point-radius", "margin",
    "gnuplot", "gnuplot-terminal", "log-level", "log-file"};

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

double parseReal(const std::string& text, const std::string& what) {
    const std::string value = trim(text);
    std::istringstream ss(value);
    ss.imbue(std::locale::classic());
    double result = 0.0;
    ss >> result;
    if (value.empty() || ss.fail() || !(ss >> std::ws).eof() || !std::isfinite(result)) {
        PHASECLOUD_THROW(core::ConfigException, "Invalid real number for " + what + ": '" + text + "'");
    }
    return result;
}

int parsePositiveInt(const std::string& text, const std::string& what) {
    if (text.empty()) {
        PHASECLOUD_THROW(core::ConfigException, "Missing integer for " + what);
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            PHASECLOUD_THROW(core::ConfigException, "Invalid integer for " + what + ": '" + text + "'");
        }
    }
    long value = 0;
    for (char c : text) {
        value = value * 10 + (c - '0');
        if (value > 1000000) {
            PHASECLOUD_THROW(core::ConfigException, "Integer for " + what + " is too large: " + text);
        }
    }
    if (value <= 0) {
        PHASECLOUD_THROW(core::ConfigException, what + " must be positive, got " + text);
    }
    return static_cast<int>(value);
}

} // namespace

CommandLine::CommandLine()
    : options_("Options")
    , hidden_("Positional") {
    options_.add_options()
        ("help,h", "Print this help")
        ("dimensions,d", po::value<std::string>()->value_name("WxH"),
         "Output image size (default 640x480)")
        ("zlim,z", po::value<std::string>()->value_name("START..END"),
         "Range of the residual axis (default: residual extrema)")
        ("threshold,t", po::value<double>()->value_name("VALUE"),
         "Quality threshold; points need quality > VALUE (default 0)")
        ("mirror,m", "Mirror the x axis in the 3D view")
        ("center,c", "Subtract the mean residual")
        ("color-mode", po::value<std::string>()->value_name("MODE"),
         "clamped (viridis over the z range) or periodic (rainbow) (default clamped)")
        ("color-period,p", po::value<double>()->value_name("P"),
         "Wrap length of the periodic colour mode (default 1)")
        ("fit-coefficients,f", po::value<std::string>()->value_name("a,b,c,d,e"),
         "Use these surface coefficients instead of fitting")
        ("backend,b", po::value<std::string>()->value_name("NAME"),
         "chart or gnuplot (default chart)")
        ("yaw", po::value<double>()->value_name("RAD"), "Chart rotation about the vertical axis (default 0.5)")
        ("pitch", po::value<double>()->value_name("RAD"), "Chart elevation (default 0.15)")
        ("point-radius", po::value<int>()->value_name("PX"), "Chart marker radius (default 1)")
        ("margin", po::value<int>()->value_name("PX"), "Chart border (default 20)")
        ("gnuplot", po::value<std::string>()->value_name("PATH"), "gnuplot executable (default gnuplot)")
        ("gnuplot-terminal", po::value<std::string>()->value_name("TERM"),
         "gnuplot terminal (default pngcairo)")
        ("config", po::value<std::string>()->value_name("FILE"), "YAML file with default option values")
        ("log-level", po::value<std::string>()->value_name("LEVEL"),
         "trace, debug, info, warning, error or critical (default warning)")
        ("log-file", po::value<std::string>()->value_name("FILE"), "Append log output to FILE");

    hidden_.add_options()
        ("paths", po::value<std::vector<std::string>>(), "UNWRAPPED QUALITY OUTPUT");
    positional_.add("paths", -1);
}

std::string CommandLine::usage() const {
    std::stringstream ss;
    ss << "Usage: phasecloud [options] UNWRAPPED QUALITY OUTPUT\n\n"
       << "Fit and subtract the rational reference surface from an unwrapped phase\n"
       << "field and render the residual as a coloured 3D point cloud.\n\n"
       << options_;
    return ss.str();
}

CommandLineOptions CommandLine::parse(int argc, const char* const argv[]) const {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLineOptions CommandLine::parse(const std::vector<std::string>& args) const {
    po::options_description all;
    all.add(options_).add(hidden_);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(all).positional(positional_).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        PHASECLOUD_THROW(core::ConfigException, e.what());
    }

    CommandLineOptions options;
    if (vm.count("help")) {
        options.helpRequested = true;
        return options;
    }

    const std::vector<std::string> paths =
        vm.count("paths") ? vm["paths"].as<std::vector<std::string>>() : std::vector<std::string>();
    if (paths.size() != 3) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Expected UNWRAPPED QUALITY OUTPUT paths, got " + std::to_string(paths.size()) +
                         " positional argument(s)");
    }
    options.unwrappedPath = paths[0];
    options.qualityPath = paths[1];
    options.outputPath = paths[2];

    api::PipelineConfig& config = options.pipeline;

    if (vm.count("config")) {
        options.configFile = vm["config"].as<std::string>();
        core::Configuration configuration;
        configuration.load(options.configFile);
        applyConfiguration(configuration, config);
    }

    if (vm.count("dimensions")) {
        config.dimensions = parseDimensions(vm["dimensions"].as<std::string>());
    }
    if (vm.count("zlim")) {
        config.zRange = parseRange(vm["zlim"].as<std::string>());
    }
    if (vm.count("threshold")) {
        config.threshold = vm["threshold"].as<double>();
    }
    if (vm.count("mirror")) {
        config.mirror = true;
    }
    if (vm.count("center")) {
        config.center = true;
    }
    if (vm.count("color-mode")) {
        config.colorMode = render::parseColorMode(vm["color-mode"].as<std::string>());
    }
    if (vm.count("color-period")) {
        config.colorPeriod = vm["color-period"].as<double>();
    }
    if (vm.count("fit-coefficients")) {
        config.fitCoefficients = parseCoefficients(vm["fit-coefficients"].as<std::string>());
    }
    if (vm.count("backend")) {
        config.renderer.backend = render::parseBackend(vm["backend"].as<std::string>());
    }
    if (vm.count("yaw")) {
        config.view.yaw = vm["yaw"].as<double>();
    }
    if (vm.count("pitch")) {
        config.view.pitch = vm["pitch"].as<double>();
    }
    if (vm.count("point-radius")) {
        config.view.pointRadius = vm["point-radius"].as<int>();
    }
    if (vm.count("margin")) {
        config.view.margin = vm["margin"].as<int>();
    }
    if (vm.count("gnuplot")) {
        config.renderer.gnuplot.executable = vm["gnuplot"].as<std::string>();
    }
    if (vm.count("gnuplot-terminal")) {
        config.renderer.gnuplot.terminal = vm["gnuplot-terminal"].as<std::string>();
    }
    if (vm.count("log-level")) {
        config.logLevel = vm["log-level"].as<std::string>();
    }
    if (vm.count("log-file")) {
        config.logFile = vm["log-file"].as<std::string>();
    }

    config.validate();
    return options;
}

cv::Size CommandLine::parseDimensions(const std::string& text) {
    const size_t sep = text.find('x');
    if (sep == std::string::npos || text.find('x', sep + 1) != std::string::npos) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Dimensions must be of the form WIDTHxHEIGHT, got '" + text + "'");
    }
    const int width = parsePositiveInt(text.substr(0, sep), "width");
    const int height = parsePositiveInt(text.substr(sep + 1), "height");
    return cv::Size(width, height);
}

core::AxisRange CommandLine::parseRange(const std::string& text) {
    const size_t sep = text.find("..");
    if (sep == std::string::npos || text.find("..", sep + 2) != std::string::npos) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Range must be of the form START..END, got '" + text + "'");
    }
    const double start = parseReal(text.substr(0, sep), "range start");
    const double end = parseReal(text.substr(sep + 2), "range end");
    return core::AxisRange(start, end);
}

std::vector<double> CommandLine::parseCoefficients(const std::string& text) {
    std::vector<double> values;
    size_t begin = 0;
    while (true) {
        const size_t comma = text.find(',', begin);
        const std::string token = text.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin);
        values.push_back(parseReal(token, "fit coefficient " + std::to_string(values.size() + 1)));
        if (comma == std::string::npos) {
            break;
        }
        begin = comma + 1;
    }
    if (values.size() != core::FitCoefficients::COUNT) {
        PHASECLOUD_THROW(core::ConfigException,
                         "Expected 5 comma-separated fit coefficients (a,b,c,d,e), got " +
                         std::to_string(values.size()));
    }
    return values;
}

void CommandLine::applyConfiguration(const core::Configuration& configuration, api::PipelineConfig& config) {
    for (const std::string& key : configuration.keys()) {
        if (kConfigKeys.count(key) == 0) {
            PHASECLOUD_LOG_WARNING(kComponent) << "Ignoring unknown configuration key '" << key << "'";
        }
    }

    if (configuration.has("dimensions")) {
        config.dimensions = parseDimensions(configuration.getString("dimensions"));
    }
    if (configuration.has("zlim")) {
        config.zRange = parseRange(configuration.getString("zlim"));
    }
    config.threshold = configuration.get<double>("threshold", config.threshold);
    config.mirror = configuration.get<bool>("mirror", config.mirror);
    config.center = configuration.get<bool>("center", config.center);
    if (configuration.has("color-mode")) {
        config.colorMode = render::parseColorMode(configuration.getString("color-mode"));
    }
    config.colorPeriod = configuration.get<double>("color-period", config.colorPeriod);
    if (configuration.has("fit-coefficients")) {
        config.fitCoefficients = parseCoefficients(configuration.getString("fit-coefficients"));
    }
    if (configuration.has("backend")) {
        config.renderer.backend = render::parseBackend(configuration.getString("backend"));
    }
    config.view.yaw = configuration.get<double>("yaw", config.view.yaw);
    config.view.pitch = configuration.get<double>("pitch", config.view.pitch);
    config.view.pointRadius = configuration.get<int>("point-radius", config.view.pointRadius);
    config.view.margin = configuration.get<int>("margin", config.view.margin);
    config.renderer.gnuplot.executable =
        configuration.get<std::string>("gnuplot", config.renderer.gnuplot.executable);
    config.renderer.gnuplot.terminal =
        configuration.get<std::string>("gnuplot-terminal", config.renderer.gnuplot.terminal);
    config.logLevel = configuration.get<std::string>("log-level", config.logLevel);
    config.logFile = configuration.get<std::string>("log-file", config.logFile);
}

} // namespace cli
} // namespace phasecloud
