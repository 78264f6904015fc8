/**
 * TrackDL - concurrent track downloader
 *
 * Command line driver: queues the given track ids, waits for the
 * download queue to drain and prints a summary.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* programName) {
    std::cout << "TrackDL - concurrent track downloader\n"
              << "\nUsage: " << programName << " [options] <trackId> [<trackId> ...]\n"
              << "\nOptions:\n"
              << "  -o, --output <dir>   Download directory (default: downloads.folder)\n"
              << "  -w, --workers <n>    Concurrent downloads, 1-10 (default: downloads.concurrentDownloads)\n"
              << "  -c, --config <file>  Configuration file (default: " << trackdl::utils::PathUtils::getConfigPath().string() << ")\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Load the config file, creating it with defaults on first run
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& logger = trackdl::core::Logger::instance();
    auto& config = trackdl::core::Config::instance();

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            logger.error("Invalid configuration file {}", configPath.string());
            return false;
        }
        logger.info("Configuration loaded from {}", configPath.string());
    } else if (config.save(configPath.string())) {
        logger.info("Default configuration created at {}", configPath.string());
    } else {
        logger.warn("Could not write default configuration to {}", configPath.string());
    }

    config.applyEnvironment();
    return true;
}

struct Summary {
    std::mutex mutex;
    size_t completed{0};
    size_t failed{0};
    size_t cancelled{0};
    uint64_t bytes{0};
};

} // namespace

int main(int argc, char* argv[]) {
    bool debugMode = false;
    std::string outputDir;
    std::string configFile;
    int workers = 0;
    std::vector<std::string> trackIds;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto needValue = [&](const std::string& option) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--output" || arg == "-o") {
            outputDir = needValue(arg);
        } else if (arg == "--config" || arg == "-c") {
            configFile = needValue(arg);
        } else if (arg == "--workers" || arg == "-w") {
            std::string value = needValue(arg);
            try {
                workers = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << value << "\n";
                return 1;
            }
            if (workers <= 0 || workers > trackdl::core::downloader::DownloadManager::kMaxWorkers) {
                std::cerr << "Worker count must be between 1 and "
                          << trackdl::core::downloader::DownloadManager::kMaxWorkers << "\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "TrackDL v1.0.0" << std::endl;
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            printUsage(argv[0]);
            return 1;
        } else {
            trackIds.push_back(arg);
        }
    }

    if (trackIds.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    trackdl::core::Logger::instance().initialize(
        debugMode ? trackdl::core::LogLevel::Debug : trackdl::core::LogLevel::Info
    );
    auto& logger = trackdl::core::Logger::instance();
    auto& config = trackdl::core::Config::instance();

    fs::path configPath = configFile.empty()
        ? trackdl::utils::PathUtils::getConfigPath()
        : fs::path(configFile);
    if (!loadConfiguration(configPath)) {
        logger.critical("Failed to load configuration");
        return 1;
    }

    // Re-initialize with the configured level and log directory
    std::string logDir = config.get<std::string>("logging.directory", "");
    if (logDir.empty()) {
        logDir = trackdl::utils::PathUtils::getLogsPath().string();
    }
    trackdl::core::Logger::instance().initialize(
        debugMode ? trackdl::core::LogLevel::Debug
                  : trackdl::core::Logger::parseLevel(config.get<std::string>("logging.level", "info")),
        logDir
    );

    if (workers > 0) {
        config.set("downloads.concurrentDownloads", workers);
    }
    if (outputDir.empty()) {
        outputDir = config.get<std::string>("downloads.folder", "");
    }
    if (outputDir.empty()) {
        logger.critical("No output directory specified");
        return 1;
    }

    setupSignalHandlers();

    // Declared before the application so it outlives the workers
    Summary summary;

    try {
        trackdl::core::Application app;
        if (!app.initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        app.getEventBus().subscribe(
            trackdl::core::kDownloadProgressEvent,
            [&summary](const trackdl::core::json& event) {
                using namespace trackdl::core::downloader;

                auto state = parseDownloadState(event.value("status", ""));
                if (!state || !isTerminal(*state)) {
                    return;
                }

                std::lock_guard<std::mutex> lock(summary.mutex);
                switch (*state) {
                    case DownloadState::Completed:
                        ++summary.completed;
                        if (event.contains("result") && event["result"].is_object()) {
                            summary.bytes += event["result"].get<DownloadResult>().fileSize;
                        }
                        break;
                    case DownloadState::Error:
                        ++summary.failed;
                        break;
                    case DownloadState::Cancelled:
                        ++summary.cancelled;
                        break;
                    default:
                        break;
                }
            }
        );

        auto& manager = app.getDownloadManager();

        std::vector<trackdl::core::downloader::DownloadJob> jobs;
        jobs.reserve(trackIds.size());
        for (const auto& id : trackIds) {
            jobs.emplace_back(id, outputDir);
        }

        size_t queued = manager.enqueueMany(jobs);
        logger.info("Queued {} of {} tracks into {}", queued, jobs.size(), outputDir);

        while (!manager.waitForAll(std::chrono::milliseconds(200))) {
            if (g_interrupted) {
                logger.info("Interrupted, finishing active downloads...");
                break;
            }
        }

        app.shutdown();

        std::lock_guard<std::mutex> lock(summary.mutex);
        logger.info("Done: {} completed ({}), {} failed, {} cancelled",
                    summary.completed,
                    trackdl::utils::StringUtils::formatBytes(static_cast<int64_t>(summary.bytes)),
                    summary.failed, summary.cancelled);

        return summary.failed > 0 || g_interrupted ? 1 : 0;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
