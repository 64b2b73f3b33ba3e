/**
 * Downlink - Command-line downloader
 *
 * Main entry point. Downloads the URLs given on the command line into a
 * directory through the download engine and waits until every one of
 * them has finished.
 *
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/EngineException.hpp"
#include "core/Logger.hpp"
#include "engine/DownloadEngine.hpp"
#include "engine/EngineConfiguration.hpp"
#include "transport/HttpTransport.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"
#include "utils/PlatformUtils.hpp"

namespace fs = std::filesystem;

using downlink::core::Config;
using downlink::core::Logger;
using downlink::models::Download;
using downlink::models::DownloadError;

// Set by the signal handler, polled by the wait loop
std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int /*signal*/) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

/**
 * Command line options
 */
struct Options {
    std::vector<std::string> urls;
    std::vector<std::string> overrides;
    std::string configPath;
    std::string outputDir;
    int jobs{0};
    bool debug{false};
};

/**
 * Tracks the downloads started by this run and prints their progress
 */
class ConsoleListener : public downlink::engine::DownloadListener {
public:
    void watch(int id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.insert(id);
    }

    void onStarted(const Download& download,
                   const std::vector<downlink::models::DownloadBlock>& /*blocks*/,
                   int totalBlocks) override {
        if (!isWatched(download.id)) return;
        std::cout << "[" << download.id << "] started " << download.url
                  << " (" << totalBlocks << " block" << (totalBlocks == 1 ? "" : "s") << ")" << std::endl;
    }

    void onProgress(const Download& download, int64_t etaMillis, int64_t bytesPerSecond) override {
        if (!isWatched(download.id)) return;
        std::cout << "[" << download.id << "] " << download.progress() << "% "
                  << download.downloaded << "/" << download.total << " bytes, "
                  << bytesPerSecond / 1024 << " KiB/s";
        if (etaMillis >= 0) {
            std::cout << ", " << etaMillis / 1000 << "s left";
        }
        std::cout << std::endl;
    }

    void onWaitingNetwork(const Download& download) override {
        if (!isWatched(download.id)) return;
        std::cout << "[" << download.id << "] waiting for network" << std::endl;
    }

    void onCompleted(const Download& download) override {
        std::cout << "[" << download.id << "] saved " << download.file << std::endl;
        finish(download.id, true);
    }

    void onError(const Download& download, DownloadError error) override {
        std::cerr << "[" << download.id << "] failed: " << downlink::models::toString(error) << std::endl;
        finish(download.id, false);
    }

    void onCancelled(const Download& download) override {
        finish(download.id, false);
    }

    /**
     * Wait until every watched download finished or a stop was requested
     * @return true if all of them completed
     */
    bool waitAll() {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_pending.empty() && !g_stopRequested) {
            m_condition.wait_for(lock, std::chrono::milliseconds(200));
        }
        return m_pending.empty() && m_failures == 0;
    }

private:
    bool isWatched(int id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.count(id) != 0;
    }

    void finish(int id, bool success) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_pending.erase(id) == 0) return;
            if (!success) ++m_failures;
        }
        m_condition.notify_all();
    }

    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::set<int> m_pending;
    int m_failures{0};
};

void printUsage(const char* program) {
    std::cout << "Downlink - download manager\n"
              << "\nUsage: " << program << " [options] URL...\n"
              << "\nOptions:\n"
              << "  -o, --output DIR     Destination directory (default: ~/Downloads)\n"
              << "  -j, --jobs N         Concurrent downloads\n"
              << "  -c, --config FILE    Configuration file\n"
              << "  -s, --set KEY=VALUE  Override a configuration key\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << std::endl;
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const Options& options) {
    auto& config = Config::instance();

    try {
        fs::path configPath = options.configPath.empty()
            ? downlink::utils::PathUtils::getConfigPath()
            : fs::path(options.configPath);

        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                std::cerr << "Cannot parse configuration " << configPath.string() << std::endl;
                return false;
            }
        } else if (options.configPath.empty()) {
            config.setDefaults();
            config.save(configPath.string());
        } else {
            std::cerr << "Configuration " << configPath.string() << " not found" << std::endl;
            return false;
        }

        for (const auto& rejected : config.applyOverrides(options.overrides)) {
            std::cerr << "Ignoring invalid override '" << rejected << "'" << std::endl;
        }
        if (options.jobs > 0) {
            config.set("engine.concurrentLimit", options.jobs);
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "Downlink v1.0.0" << std::endl;
            return 0;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--output" || arg == "-o") {
            options.outputDir = next();
        } else if (arg == "--config" || arg == "-c") {
            options.configPath = next();
        } else if (arg == "--set" || arg == "-s") {
            options.overrides.push_back(next());
        } else if (arg == "--jobs" || arg == "-j") {
            try {
                options.jobs = std::stoi(next());
            } catch (const std::exception&) {
                std::cerr << "Invalid job count" << std::endl;
                return 2;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            options.urls.push_back(arg);
        }
    }

    if (options.urls.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (!loadConfiguration(options)) {
        return 1;
    }

    auto& config = Config::instance();
    auto& logger = Logger::instance();

    downlink::core::LogLevel level = options.debug
        ? downlink::core::LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    logger.initialize(level, config.get<std::string>("logging.directory", ""));
    logger.info("Downlink v1.0.0 starting on {} ({})",
                downlink::utils::PlatformUtils::getOSName(),
                downlink::utils::PlatformUtils::getHostname());

    setupSignalHandlers();

    fs::path outputDir = options.outputDir.empty()
        ? downlink::utils::PathUtils::getDownloadsPath()
        : fs::path(options.outputDir);
    if (!downlink::utils::FileUtils::createDirectories(outputDir)) {
        logger.critical("Cannot create output directory {}", outputDir.string());
        return 1;
    }

    try {
        auto engineConfig = downlink::engine::EngineConfiguration::fromConfig(config);
        engineConfig.transport = std::make_shared<downlink::transport::HttpTransport>(
            downlink::transport::HttpOptions::fromConfig(config));

        downlink::engine::DownloadEngine engine(engineConfig);
        auto listener = std::make_shared<ConsoleListener>();
        engine.addListener(listener, false).get();

        std::map<std::string, int> usedNames;
        for (const auto& url : options.urls) {
            std::string name = downlink::utils::FileUtils::fileNameFromUrl(url);
            if (name.empty()) {
                name = "download";
            }
            if (int count = usedNames[name]++; count > 0) {
                name += "." + std::to_string(count);
            }

            downlink::models::Request request(url, (outputDir / name).string());
            request.enqueueAction = downlink::models::EnqueueAction::ReplaceExisting;

            try {
                listener->watch(request.id);
                auto stored = engine.enqueue(request).get();
                logger.info("Queued {} -> {}", url, stored.file);
            } catch (const downlink::core::EngineException& e) {
                logger.error("Cannot queue {}: {}", url, e.what());
                return 1;
            }
        }

        bool success = listener->waitAll();
        if (g_stopRequested) {
            logger.info("Interrupted, stopping transfers");
        }

        engine.close();
        logger.info("Downlink finished");
        logger.flush();
        return success ? 0 : 1;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
