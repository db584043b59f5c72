/**
 * LockerFetch - Adaptive file-locker downloader
 * 
 * Command line entry point.
 * 
 * @version 1.0.0
 * @license MIT
 */

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EngineConfig.hpp"
#include "core/Logger.hpp"
#include "utils/HttpClient.hpp"
#include "utils/PathUtils.hpp"
#include "utils/PlatformUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using lockerfetch::core::Application;
using lockerfetch::core::Config;
using lockerfetch::core::EngineConfig;
using lockerfetch::core::Logger;
using lockerfetch::core::LogLevel;
using lockerfetch::utils::StringUtils;

// Global application instance for signal handling
std::unique_ptr<Application> g_app;

/**
 * Signal handler: only flips the cancellation flag
 */
extern "C" void signalHandler(int) {
    if (g_app) {
        g_app->requestCancel();
    }
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

/**
 * Parsed command line
 */
struct CommandLine {
    std::vector<std::string> urls;
    std::string urlFile;
    std::string configPath;
    std::string reportPath;
    bool debug{false};
    bool showHelp{false};
    bool showVersion{false};
    std::string error;
};

void printUsage(const char* program) {
    std::cout << "LockerFetch - Adaptive file-locker downloader\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -u, --url URL          URL to download (repeatable)\n"
              << "  -f, --file PATH        File with one URL per line\n"
              << "  -o, --output DIR       Download directory\n"
              << "  -c, --concurrent N     Maximum concurrent downloads (1 = sequential)\n"
              << "      --retries N        Attempts per file\n"
              << "      --min-delay S      Minimum delay before a request, in seconds\n"
              << "      --max-delay S      Maximum delay before a request, in seconds\n"
              << "      --proxy URL        Proxy for every request\n"
              << "      --respect-robots   Honour robots.txt\n"
              << "      --config PATH      Configuration file\n"
              << "      --report PATH      Write a JSON report\n"
              << "  -d, --debug            Enable debug output\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * Parse arguments; engine overrides are written straight into the config store
 */
CommandLine parseArguments(int argc, char* argv[], Config& config) {
    CommandLine cmd;
    std::vector<std::pair<std::string, std::string>> overrides;

    auto needValue = [&](int& i, const std::string& name) -> std::string {
        if (i + 1 >= argc) {
            cmd.error = "missing value for " + name;
            return "";
        }
        return argv[++i];
    };

    for (int i = 1; i < argc && cmd.error.empty(); ++i) {
        std::string arg(argv[i]);
        if (arg == "-u" || arg == "--url") {
            std::string value = needValue(i, arg);
            if (!value.empty()) cmd.urls.push_back(value);
        } else if (arg == "-f" || arg == "--file") {
            cmd.urlFile = needValue(i, arg);
        } else if (arg == "-o" || arg == "--output") {
            overrides.emplace_back("engine.downloadDir", needValue(i, arg));
        } else if (arg == "-c" || arg == "--concurrent") {
            overrides.emplace_back("engine.maxConcurrentDownloads", needValue(i, arg));
        } else if (arg == "--retries") {
            overrides.emplace_back("engine.maxRetries", needValue(i, arg));
        } else if (arg == "--min-delay") {
            overrides.emplace_back("engine.minDelay", needValue(i, arg));
        } else if (arg == "--max-delay") {
            overrides.emplace_back("engine.maxDelay", needValue(i, arg));
        } else if (arg == "--proxy") {
            overrides.emplace_back("engine.proxy", needValue(i, arg));
        } else if (arg == "--respect-robots") {
            overrides.emplace_back("engine.respectRobots", "true");
        } else if (arg == "--config") {
            cmd.configPath = needValue(i, arg);
        } else if (arg == "--report") {
            cmd.reportPath = needValue(i, arg);
        } else if (arg == "-d" || arg == "--debug") {
            cmd.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            cmd.showVersion = true;
        } else {
            cmd.error = "unknown option " + arg;
        }
    }

    if (!cmd.error.empty()) {
        return cmd;
    }

    // The config file goes first so command line values win
    fs::path configPath = cmd.configPath.empty()
        ? lockerfetch::utils::PathUtils::getConfigPath()
        : fs::path(cmd.configPath);
    if (fs::exists(configPath) && !config.load(configPath.string())) {
        cmd.error = "cannot parse configuration file " + configPath.string();
        return cmd;
    }
    if (!cmd.configPath.empty() && !fs::exists(configPath)) {
        cmd.error = "configuration file not found: " + configPath.string();
        return cmd;
    }

    for (const auto& [key, value] : overrides) {
        if (key == "engine.downloadDir" || key == "engine.proxy") {
            config.set(key, value);
        } else if (key == "engine.respectRobots") {
            config.set(key, true);
        } else if (key == "engine.minDelay" || key == "engine.maxDelay") {
            double seconds = StringUtils::parseDouble(value, -1.0);
            if (seconds < 0.0) {
                cmd.error = "invalid delay: " + value;
                return cmd;
            }
            config.set(key, seconds);
        } else {
            int64_t number = StringUtils::parseLong(value, 0);
            if (number < 1) {
                cmd.error = "invalid number: " + value;
                return cmd;
            }
            config.set(key, static_cast<int>(number));
        }
    }

    return cmd;
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    auto& config = Config::instance();
    CommandLine cmd = parseArguments(argc, argv, config);

    if (cmd.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (cmd.showVersion) {
        std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
        return 0;
    }
    if (!cmd.error.empty()) {
        std::cerr << "Error: " << cmd.error << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    lockerfetch::core::LoggerOptions logOptions;
    logOptions.level = cmd.debug ? LogLevel::Debug : LogLevel::Info;
    logOptions.fileSink = config.get<bool>("logging.fileSink", true);
    Logger::instance().initialize(logOptions);

    auto& logger = Logger::instance();
    logger.info("{} v{} starting on {}", Application::getName(), Application::getVersion(),
                lockerfetch::utils::PlatformUtils::getOSName());

    std::vector<std::string> urls = cmd.urls;
    if (!cmd.urlFile.empty()) {
        if (!fs::exists(cmd.urlFile)) {
            logger.critical("URL file not found: {}", cmd.urlFile);
            return 1;
        }
        auto fromFile = Application::readUrlFile(cmd.urlFile);
        logger.info("Loaded {} URLs from {}", fromFile.size(), cmd.urlFile);
        urls.insert(urls.end(), fromFile.begin(), fromFile.end());
    }
    if (urls.empty()) {
        logger.error("No URLs given; use -u URL or -f FILE");
        return 1;
    }

    lockerfetch::utils::CurlGlobalInit::init();
    setupSignalHandlers();

    try {
        g_app = std::make_unique<Application>(EngineConfig::fromConfig(config));

        if (!g_app->initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        int exitCode = g_app->run(urls, cmd.reportPath);
        if (g_app->isCancelled()) {
            logger.warn("Interrupted; partial files were kept for resuming");
        }

        logger.flush();
        return exitCode;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
