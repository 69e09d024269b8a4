#pragma once

/**
 * Application.hpp
 *
 * Core application class that owns the download engine for one state
 * directory. Wires the task store, storage admission, transfer client
 * and catalog into the DownloadManager and runs the maintenance loop.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tapedeck::utils { class FileLock; }

namespace tapedeck::core::downloader {
class DownloadManager;
class JsonTaskStore;
class DiskStorageManager;
class CprTransferClient;
class JsonManifestResolver;
class PreferenceFormatFilter;
struct CleanupReport;
}

namespace tapedeck::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    Running,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * initialize() prepares the engine without moving any bytes, which is all
 * the one-shot CLI commands need; start() adds the scheduler and the
 * maintenance thread for the daemon.
 */
class Application {
public:
    /**
     * Constructor
     */
    Application();

    /**
     * Destructor
     */
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize the engine on a state directory. Takes an exclusive lock
     * on the directory, loads the task store and requeues tasks a previous
     * run left in DOWNLOADING.
     * @param stateDir State directory (empty = default app data location)
     * @return true if initialization successful
     */
    bool initialize(const std::filesystem::path& stateDir = {});

    /**
     * Start the scheduler and the maintenance thread
     * @return false if the application is not Ready
     */
    bool start();

    /**
     * Shutdown the application gracefully
     */
    void shutdown();

    /**
     * Get current application state
     * @return Current AppState
     */
    AppState getState() const { return m_state.load(); }

    /**
     * Check if application is running
     * @return true if in Ready or Running state
     */
    bool isRunning() const;

    /**
     * Get download manager instance
     * @return Download manager, valid after initialize()
     */
    downloader::DownloadManager& downloads() { return *m_downloadManager; }

    /**
     * Catalog of manifests consulted by enqueueRecording()
     */
    downloader::JsonManifestResolver& catalog() { return *m_catalog; }

    /**
     * One maintenance pass: automatic retry (when enabled) and the
     * grace-period cleanup
     * @param lowSpace Use the shortened low-space grace period
     */
    downloader::CleanupReport runMaintenance(bool lowSpace = false);

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    const std::filesystem::path& stateDir() const { return m_stateDir; }

    /**
     * Get application version string
     * @return Version string
     */
    static std::string getVersion() { return "1.0.0"; }

    /**
     * Get application name
     * @return Application name
     */
    static std::string getName() { return "Tapedeck"; }

private:
    /**
     * Set application state and notify listeners
     * @param state New state
     */
    void setState(AppState state);

    /**
     * Build store, storage manager, transfer client and download manager
     * @return true if successful
     */
    bool initializeDownloader();

    void maintenanceLoop();

    /**
     * Called by the scheduler when free space drops below the threshold
     */
    void onLowSpace(uint64_t availableBytes);

private:
    // Application state
    std::atomic<AppState> m_state{AppState::Uninitialized};

    // State change callbacks
    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    std::filesystem::path m_stateDir;
    std::unique_ptr<utils::FileLock> m_lock;

    // Download engine, destroyed in reverse order
    std::unique_ptr<downloader::JsonTaskStore> m_store;
    std::unique_ptr<downloader::DiskStorageManager> m_storage;
    std::unique_ptr<downloader::CprTransferClient> m_client;
    std::shared_ptr<downloader::JsonManifestResolver> m_catalog;
    std::shared_ptr<downloader::PreferenceFormatFilter> m_formatFilter;
    std::unique_ptr<downloader::DownloadManager> m_downloadManager;

    // Maintenance thread
    std::thread m_maintenanceThread;
    std::mutex m_maintenanceMutex;
    std::condition_variable m_maintenanceWakeup;
    bool m_stopMaintenance{false};
    bool m_lowSpacePending{false};
};

} // namespace tapedeck::core
