/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "EventBus.hpp"
#include "Logger.hpp"
#include "downloader/Catalog.hpp"
#include "downloader/CprTransferClient.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/StorageManager.hpp"
#include "downloader/TaskStore.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/NetworkUtils.hpp"
#include "../utils/PathUtils.hpp"
#include "../utils/StringUtils.hpp"

#include <algorithm>

namespace tapedeck::core {

namespace {

std::chrono::hours gracePeriodHours(const char* key, int64_t fallback) {
    return std::chrono::hours(Config::instance().getAtLeast<int64_t>(key, fallback, 0));
}

} // namespace

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize(const std::filesystem::path& stateDir) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    m_stateDir = stateDir.empty() ? utils::PathUtils::getStatePath() : stateDir;
    if (!utils::FileUtils::createDirectories(m_stateDir)) {
        Logger::instance().error("Cannot create state directory {}", m_stateDir.string());
        setState(AppState::Error);
        return false;
    }

    m_lock = std::make_unique<utils::FileLock>(m_stateDir / "tapedeck.lock");
    if (!m_lock->isLocked()) {
        Logger::instance().error("State directory {} is in use by another instance", m_stateDir.string());
        m_lock.reset();
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        m_lock.reset();
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    EventBus::instance().emit(events::AppInitialized, {{"stateDir", m_stateDir.string()}});
    return true;
}

bool Application::initializeDownloader() {
    try {
        auto& config = Config::instance();
        auto options = downloader::DownloadManagerOptions::fromConfig();

        bool customState = m_stateDir != utils::PathUtils::getStatePath();
        if (customState && config.get<std::string>("downloads.directory", "").empty()) {
            options.downloadsDir = m_stateDir / "downloads";
        }

        m_store = std::make_unique<downloader::JsonTaskStore>(
            m_stateDir / "downloads.json",
            std::chrono::milliseconds(config.get<int64_t>("downloads.progressFlushInterval", 2000)));
        if (!m_store->load()) {
            Logger::instance().warn("Task store {} was unreadable, starting with an empty queue",
                                    m_store->path().string());
        }

        auto quotaMB = config.getAtLeast<int64_t>("storage.quotaMB", 0, 0);
        m_storage = std::make_unique<downloader::DiskStorageManager>(
            options.downloadsDir, static_cast<uint64_t>(quotaMB) * 1024 * 1024);

        downloader::HttpTransferOptions httpOptions;
        httpOptions.timeout = std::chrono::milliseconds(config.get<int64_t>("downloads.timeout", 30000));
        m_client = std::make_unique<downloader::CprTransferClient>(httpOptions);

        m_catalog = std::make_shared<downloader::JsonManifestResolver>(
            customState ? m_stateDir / "manifests" : utils::PathUtils::getManifestsPath());
        m_formatFilter = std::make_shared<downloader::PreferenceFormatFilter>();

        m_downloadManager = std::make_unique<downloader::DownloadManager>(*m_store, *m_storage, *m_client, options);
        m_downloadManager->setCatalog(m_catalog, m_formatFilter);

        bool wifiOnly = config.get<bool>("downloads.wifiOnly", true);
        m_downloadManager->setNetworkPolicy([wifiOnly] {
            return utils::NetworkUtils::canTransferNow(wifiOnly);
        });
        m_downloadManager->setCompletionHook([](const std::string& recordingId) {
            Logger::instance().info("Recording {} is available offline", recordingId);
        });
        m_downloadManager->setLowSpaceHandler([this](uint64_t available) { onLowSpace(available); });

        size_t recovered = m_downloadManager->initialize();
        Logger::instance().info("Download engine ready: {} tasks, {} recovered, downloads in {}",
                                m_store->listAll().size(), recovered, options.downloadsDir.string());
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        m_downloadManager.reset();
        return false;
    }
}

bool Application::start() {
    if (m_state != AppState::Ready) {
        Logger::instance().warn("Cannot start: application not ready");
        return false;
    }

    m_downloadManager->start();

    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_stopMaintenance = false;
    }
    m_maintenanceThread = std::thread([this] { maintenanceLoop(); });

    setState(AppState::Running);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_stopMaintenance = true;
    }
    m_maintenanceWakeup.notify_all();
    if (m_maintenanceThread.joinable()) {
        m_maintenanceThread.join();
    }

    // Shutdown subsystems in reverse order
    if (m_downloadManager) {
        m_downloadManager->shutdown();
    }
    m_downloadManager.reset();
    m_formatFilter.reset();
    m_catalog.reset();
    m_client.reset();
    m_storage.reset();
    if (m_store) {
        try {
            m_store->flush();
        } catch (const downloader::PersistenceError& e) {
            Logger::instance().error("Could not save task store: {}", e.what());
        }
    }
    m_store.reset();
    m_lock.reset();

    EventBus::instance().emit(events::AppShutdown, {});
    Logger::instance().info("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

bool Application::isRunning() const {
    auto state = m_state.load();
    return state == AppState::Ready || state == AppState::Running;
}

downloader::CleanupReport Application::runMaintenance(bool lowSpace) {
    auto& config = Config::instance();

    if (config.get<bool>("downloads.autoRetry", true)) {
        m_downloadManager->autoRetry();
    }

    auto grace = lowSpace ? gracePeriodHours("deletion.lowSpaceGracePeriodHours", 0)
                          : gracePeriodHours("deletion.gracePeriodHours", 168);
    auto report = m_downloadManager->cleanup(downloader::Clock::now(), grace);

    if (lowSpace) {
        Logger::instance().info("Low-space cleanup freed {}", utils::StringUtils::formatBytes(report.freedBytes));
    }
    return report;
}

void Application::maintenanceLoop() {
    auto interval = std::chrono::seconds(
        Config::instance().getAtLeast<int64_t>("scheduler.safetyInterval", 60, 1));

    std::unique_lock<std::mutex> lock(m_maintenanceMutex);
    while (!m_stopMaintenance) {
        m_maintenanceWakeup.wait_for(lock, interval, [this] {
            return m_stopMaintenance || m_lowSpacePending;
        });
        if (m_stopMaintenance) {
            break;
        }
        bool lowSpace = m_lowSpacePending;
        m_lowSpacePending = false;

        lock.unlock();
        try {
            runMaintenance(lowSpace);
            m_downloadManager->scheduler().requestPass();
        } catch (const std::exception& e) {
            Logger::instance().error("Maintenance pass failed: {}", e.what());
        }
        lock.lock();
    }
}

void Application::onLowSpace(uint64_t availableBytes) {
    Logger::instance().warn("Only {} left for downloads, scheduling cleanup",
                            utils::StringUtils::formatBytes(availableBytes));
    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_lowSpacePending = true;
    }
    m_maintenanceWakeup.notify_one();
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

} // namespace tapedeck::core
