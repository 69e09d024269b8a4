/**
 * @file test_application.cpp
 * @brief Unit tests for configuration and application wiring
 */

#include <gtest/gtest.h>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "utils/test_helpers.hpp"

#include <vector>

namespace tapedeck::test {
namespace {

using namespace core::downloader;
using core::AppState;
using core::Application;
using core::Config;
using namespace std::chrono_literals;

// -- Config --

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        Config::instance().setDefaults();
    }

    TempDir m_dir;
};

TEST_F(ConfigTest, DefaultsCoverEngineSettings) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 0), 3);
    EXPECT_EQ(config.get<int>("downloads.maxRetries", 0), 3);
    EXPECT_EQ(config.get<int64_t>("deletion.gracePeriodHours", 0), 168);
    EXPECT_TRUE(config.get<bool>("downloads.wifiOnly", false));
    EXPECT_EQ(config.get<std::string>("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.set("downloads.maxConcurrent", std::string("many")));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 7), 7);
}

TEST_F(ConfigTest, PartialFileMergesOverDefaults) {
    auto path = writeFile(m_dir / "config.json",
                          std::string(R"({"downloads": {"maxConcurrent": 5}, "deletion": {"gracePeriodHours": 24}})"));
    auto& config = Config::instance();

    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 0), 5);
    EXPECT_EQ(config.get<int64_t>("deletion.gracePeriodHours", 0), 24);
    EXPECT_EQ(config.get<int>("downloads.maxRetries", 0), 3);
}

TEST_F(ConfigTest, MistypedFileKeysResetToDefaults) {
    auto path = writeFile(m_dir / "config.json",
                          std::string(R"({"downloads": {"maxRetries": "five", "wifiOnly": false}, "storage": null})"));
    auto& config = Config::instance();

    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<int>("downloads.maxRetries", 0), 3);
    EXPECT_FALSE(config.get<bool>("downloads.wifiOnly", true));
    EXPECT_EQ(config.get<int64_t>("storage.lowSpaceThresholdMB", 0), 500);
    EXPECT_EQ(config.getAtLeast("downloads.maxConcurrent", 3, 4), 4);
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    config.set("storage.quotaMB", 2048);
    auto path = m_dir / "nested" / "config.json";
    ASSERT_TRUE(config.save(path.string()));

    config.setDefaults();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<int64_t>("storage.quotaMB", 0), 2048);

    writeFile(m_dir / "broken.json", std::string("{ nope"));
    EXPECT_FALSE(config.load((m_dir / "broken.json").string()));
    EXPECT_FALSE(config.load((m_dir / "absent.json").string()));
}

TEST_F(ConfigTest, OptionsReadFromConfig) {
    auto& config = Config::instance();
    config.set("downloads.maxConcurrent", 0);
    config.set("downloads.retryDelay", 1500);
    config.set("downloads.directory", (m_dir / "music").string());
    config.set("storage.lowSpaceThresholdMB", 1);

    auto options = DownloadManagerOptions::fromConfig();

    EXPECT_EQ(options.maxConcurrent, 1u);
    EXPECT_EQ(options.retryDelay, 1500ms);
    EXPECT_EQ(options.downloadsDir, m_dir / "music");
    EXPECT_EQ(options.lowSpaceThresholdBytes, 1024u * 1024u);
    ASSERT_FALSE(options.formatPreferences.empty());
    EXPECT_EQ(options.formatPreferences.front(), "Ogg Vorbis");
}

// -- Application --

class ApplicationTest : public ::testing::Test {
protected:
    void TearDown() override {
        Config::instance().setDefaults();
        core::EventBus::instance().clear();
    }

    /**
     * Task record written before the application opens the store
     */
    DownloadTask seed(JsonTaskStore& store, const std::string& filename, DownloadStatus status) {
        DownloadTask task;
        task.id = makeTaskId("gd1977", filename);
        task.recordingId = "gd1977";
        task.trackFilename = filename;
        task.sourceUrl = "https://archive.example/download/" + filename;
        task.status = status;
        task.totalBytes = 1000;
        task.enqueueSequence = store.allocateSequence();
        store.upsert(task);
        return task;
    }

    TempDir m_dir;
};

TEST_F(ApplicationTest, InitializeLifecycle) {
    std::vector<AppState> states;
    {
        Application app;
        app.onStateChange([&](AppState state) { states.push_back(state); });

        ASSERT_TRUE(app.initialize(m_dir.path()));
        EXPECT_EQ(app.getState(), AppState::Ready);
        EXPECT_TRUE(app.isRunning());
        EXPECT_EQ(app.stateDir(), m_dir.path());
        EXPECT_TRUE(fs::exists(m_dir / "downloads"));
        EXPECT_FALSE(app.initialize(m_dir.path()));

        app.shutdown();
        EXPECT_FALSE(app.isRunning());
    }

    std::vector<AppState> expected{
        AppState::Initializing, AppState::Ready, AppState::ShuttingDown, AppState::Uninitialized
    };
    EXPECT_EQ(states, expected);
}

TEST_F(ApplicationTest, StateDirectoryIsExclusive) {
    Application first;
    ASSERT_TRUE(first.initialize(m_dir.path()));

    Application second;
    EXPECT_FALSE(second.initialize(m_dir.path()));
    EXPECT_EQ(second.getState(), AppState::Error);

    first.shutdown();
    Application third;
    EXPECT_TRUE(third.initialize(m_dir.path()));
}

TEST_F(ApplicationTest, StartRequiresReady) {
    Application app;
    EXPECT_FALSE(app.start());
}

TEST_F(ApplicationTest, RecoversInterruptedDownloadsOnStartup) {
    {
        JsonTaskStore store(m_dir / "downloads.json");
        ASSERT_TRUE(store.load());
        seed(store, "d1t01.mp3", DownloadStatus::Downloading);
        seed(store, "d1t02.mp3", DownloadStatus::Queued);
    }

    Application app;
    ASSERT_TRUE(app.initialize(m_dir.path()));

    auto stats = app.downloads().stats();
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.queued, 2u);
    EXPECT_EQ(stats.downloading, 0u);
}

TEST_F(ApplicationTest, MaintenanceRetriesAndPurges) {
    auto downloads = m_dir / "downloads";
    std::string purgedId;
    {
        JsonTaskStore store(m_dir / "downloads.json");
        ASSERT_TRUE(store.load());
        seed(store, "d1t01.mp3", DownloadStatus::Failed);

        auto done = seed(store, "d1t02.mp3", DownloadStatus::Completed);
        auto path = writeFile(destinationPath(downloads, done), size_t(1000));
        store.modify(done.id, [&](DownloadTask& t) {
            t.localPath = path.string();
            t.bytesDownloaded = 1000;
            t.isMarkedForDeletion = true;
            t.deletionTimestamp = Clock::now() - 200h;
            return true;
        });
        purgedId = done.id;
    }

    Application app;
    ASSERT_TRUE(app.initialize(m_dir.path()));

    auto report = app.runMaintenance();

    ASSERT_EQ(report.removedIds.size(), 1u);
    EXPECT_EQ(report.removedIds[0], purgedId);
    EXPECT_EQ(report.freedBytes, 1000u);
    EXPECT_FALSE(app.downloads().task(purgedId).has_value());
    EXPECT_EQ(app.downloads().task(makeTaskId("gd1977", "d1t01.mp3"))->status, DownloadStatus::Queued);
}

TEST_F(ApplicationTest, LowSpaceMaintenanceUsesShortGrace) {
    {
        JsonTaskStore store(m_dir / "downloads.json");
        ASSERT_TRUE(store.load());
        auto done = seed(store, "d1t01.mp3", DownloadStatus::Completed);
        store.modify(done.id, [](DownloadTask& t) {
            t.isMarkedForDeletion = true;
            t.deletionTimestamp = Clock::now() - 1h;
            return true;
        });
    }
    Config::instance().set("downloads.autoRetry", false);

    Application app;
    ASSERT_TRUE(app.initialize(m_dir.path()));

    EXPECT_EQ(app.runMaintenance(false).pending, 1u);
    EXPECT_EQ(app.runMaintenance(true).removedIds.size(), 1u);
}

TEST_F(ApplicationTest, EnqueueThroughCatalog) {
    auto manifest = writeFile(m_dir / "gd1977.json", std::string(R"({
        "baseUrl": "https://archive.example/download/gd1977/",
        "files": [
            {"filename": "d1t01.mp3", "format": "VBR MP3", "size": 1000},
            {"filename": "d1t01.ogg", "format": "Ogg Vorbis", "size": 800},
            {"filename": "d1t02.flac", "format": "Flac", "size": 5000}
        ]
    })"));

    Application app;
    ASSERT_TRUE(app.initialize(m_dir.path()));
    app.catalog().registerManifest("gd1977", manifest);

    auto ids = app.downloads().enqueueRecording("gd1977");
    ASSERT_TRUE(ids.has_value());
    EXPECT_EQ(ids->size(), 2u);
    EXPECT_EQ(app.downloads().recordingStatus("gd1977").totalTracks, 2u);
}

} // namespace
} // namespace tapedeck::test
