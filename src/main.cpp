/**
 * Tapedeck - offline concert download engine
 *
 * Main entry point. Runs the download daemon or a one-shot queue command
 * against the state directory.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/downloader/Catalog.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using tapedeck::core::Application;
using tapedeck::core::Config;
using tapedeck::core::LogLevel;
using tapedeck::core::LogOptions;
using tapedeck::core::Logger;
using tapedeck::utils::StringUtils;
namespace dl = tapedeck::core::downloader;

namespace {

// Set by the signal handler, polled by the run loop
std::atomic<bool> g_stopRequested{false};

void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct CommandLine {
    std::string command;
    std::vector<std::string> args;
    fs::path configPath;
    fs::path stateDir;
    bool debug{false};
};

void printUsage(const char* program) {
    std::cout << "Tapedeck - offline concert download engine\n"
              << "\nUsage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  run                              Download until interrupted\n"
              << "  enqueue <recordingId> <manifest> Queue the files of a recording\n"
              << "  status [recordingId]             Show the queue or one recording\n"
              << "  retry-all                        Requeue every failed download\n"
              << "  cleanup                          Purge downloads past their grace period\n"
              << "  clear-queue                      Remove every queued download\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Configuration file\n"
              << "  -s, --state-dir <path> State directory\n"
              << "  -d, --debug            Enable debug logging\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * Load configuration, writing the defaults on first run
 */
bool loadConfiguration(const fs::path& path) {
    auto& logger = Logger::instance();
    auto& config = Config::instance();

    if (fs::exists(path)) {
        if (!config.load(path.string())) {
            logger.error("Cannot parse configuration {}", path.string());
            return false;
        }
        logger.info("Configuration loaded from {}", path.string());
    } else if (config.save(path.string())) {
        logger.info("Default configuration created at {}", path.string());
    } else {
        logger.warn("Cannot write default configuration to {}", path.string());
    }
    return true;
}

void printTask(const dl::DownloadTask& task) {
    std::string progress = task.progressFraction
        ? StringUtils::formatPercentage(*task.progressFraction)
        : std::string("?");

    std::cout << "  " << dl::toString(task.status) << "  " << task.recordingId << "/" << task.trackFilename
              << "  " << progress << "  " << StringUtils::formatBytes(task.bytesDownloaded);
    if (task.hasKnownSize()) {
        std::cout << " / " << StringUtils::formatBytes(task.totalBytes);
    }
    if (task.priority != 0) {
        std::cout << "  priority " << task.priority;
    }
    if (task.isMarkedForDeletion) {
        std::cout << "  [marked for deletion]";
    }
    if (task.errorMessage) {
        std::cout << "  (" << *task.errorMessage << ")";
    }
    std::cout << "\n";
}

int runDaemon(Application& app) {
    if (!app.start()) {
        return 1;
    }

    // Recording and storage milestones go to stdout while the daemon runs
    auto& bus = tapedeck::core::EventBus::instance();
    auto printEvent = [](const std::string& event, const tapedeck::core::json& data) {
        std::cout << event << " " << data.dump() << std::endl;
    };
    tapedeck::core::ScopedSubscription recordings(bus.subscribeNamespace("recording", printEvent));
    tapedeck::core::ScopedSubscription storage(bus.subscribeNamespace("storage", printEvent));

    TAPEDECK_LOG_INFO("Downloading, press Ctrl+C to stop");
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    TAPEDECK_LOG_INFO("Stop requested, shutting down gracefully...");
    app.shutdown();
    return 0;
}

int enqueueCommand(Application& app, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "enqueue needs <recordingId> <manifest.json>\n";
        return 2;
    }

    app.catalog().registerManifest(args[0], args[1]);
    auto ids = app.downloads().enqueueRecording(args[0]);
    if (!ids) {
        std::cerr << "Cannot resolve recording " << args[0] << "\n";
        return 1;
    }

    std::cout << "Queued " << ids->size() << " tracks of " << args[0] << "\n";
    return 0;
}

int statusCommand(Application& app, const std::vector<std::string>& args) {
    auto& downloads = app.downloads();

    if (!args.empty()) {
        auto status = downloads.recordingStatus(args[0]);
        std::cout << status.recordingId << ": " << dl::toString(status.state)
                  << "  " << status.completedTracks << "/" << status.totalTracks << " tracks"
                  << "  " << StringUtils::formatPercentage(status.progress);
        if (status.errorMessage) {
            std::cout << "  (" << *status.errorMessage << ")";
        }
        if (status.markedForDeletion) {
            std::cout << "  [marked for deletion]";
        }
        std::cout << "\n";
        for (const auto& task : downloads.tasksForRecording(args[0])) {
            printTask(task);
        }
        return 0;
    }

    auto stats = downloads.stats();
    std::cout << stats.total << " downloads: "
              << stats.queued << " queued, " << stats.downloading << " downloading, "
              << stats.paused << " paused, " << stats.completed << " completed, "
              << stats.failed << " failed, " << stats.cancelled << " cancelled\n"
              << StringUtils::formatBytes(stats.totalBytesDownloaded) << " downloaded";
    if (stats.averageBytesPerSecond > 0.0) {
        std::cout << " at " << StringUtils::formatBytes(static_cast<uint64_t>(stats.averageBytesPerSecond)) << "/s";
    }
    std::cout << ", " << stats.markedForDeletion << " marked for deletion\n";

    auto queue = downloads.queueSnapshot();
    if (!queue.empty()) {
        std::cout << "\nQueue:\n";
        for (const auto& task : queue) {
            printTask(task);
        }
    }

    auto failed = downloads.failedDownloads();
    if (!failed.empty()) {
        std::cout << "\nFailed:\n";
        for (const auto& task : failed) {
            printTask(task);
        }
    }
    return 0;
}

int runCommand(Application& app, const CommandLine& cmd) {
    if (cmd.command == "run") {
        return runDaemon(app);
    }
    if (cmd.command == "enqueue") {
        return enqueueCommand(app, cmd.args);
    }
    if (cmd.command == "status") {
        return statusCommand(app, cmd.args);
    }
    if (cmd.command == "retry-all") {
        auto ids = app.downloads().retryAll();
        std::cout << "Requeued " << ids.size() << " failed downloads\n";
        return 0;
    }
    if (cmd.command == "cleanup") {
        auto report = app.runMaintenance();
        std::cout << "Removed " << report.removedIds.size() << " downloads, freed "
                  << StringUtils::formatBytes(report.freedBytes) << ", "
                  << report.pending << " still in grace period";
        if (!report.fileErrors.empty()) {
            std::cout << ", " << report.fileErrors.size() << " files could not be deleted";
        }
        std::cout << "\n";
        return 0;
    }
    if (cmd.command == "clear-queue") {
        std::cout << "Removed " << app.downloads().clearQueue() << " queued downloads\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd.command << "\n";
    return 2;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            cmd.debug = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            cmd.configPath = argv[++i];
        } else if ((arg == "--state-dir" || arg == "-s") && i + 1 < argc) {
            cmd.stateDir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << "\n";
            return 0;
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.args.push_back(arg);
        }
    }

    if (cmd.command.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Console only until the configuration names a log directory
    auto& logger = Logger::instance();
    LogOptions bootstrap;
    bootstrap.consoleLevel = cmd.debug ? LogLevel::Debug : LogLevel::Warn;
    logger.initialize(bootstrap);

    if (!loadConfiguration(cmd.configPath.empty() ? tapedeck::utils::PathUtils::getConfigPath() : cmd.configPath)) {
        return 1;
    }

    auto& config = Config::instance();
    LogOptions options;
    options.consoleLevel = cmd.debug ? LogLevel::Debug
                                     : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    options.fileLevel = std::min(options.consoleLevel, LogLevel::Debug);
    options.directory = config.get<std::string>("logging.directory", "");
    if (options.directory.empty()) {
        options.directory = tapedeck::utils::PathUtils::getLogsPath();
    }
    options.maxFileBytes = static_cast<size_t>(config.getAtLeast<int64_t>("logging.maxFileMB", 5, 1)) * 1024 * 1024;
    options.maxFiles = static_cast<size_t>(config.getAtLeast("logging.maxFiles", 3, 1));
    logger.initialize(options);

    // One-shot commands keep the console quiet; the file still gets everything
    if (cmd.command != "run" && !cmd.debug && options.consoleLevel < LogLevel::Warn) {
        logger.setConsoleLevel(LogLevel::Warn);
    }

    setupSignalHandlers();

    try {
        Application app;
        if (!app.initialize(cmd.stateDir)) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        int rc = runCommand(app, cmd);
        app.shutdown();
        return rc;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
