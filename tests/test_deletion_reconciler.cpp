/**
 * @file test_deletion_reconciler.cpp
 * @brief Unit tests for soft delete and cleanup
 */

#include <gtest/gtest.h>

#include "core/EventBus.hpp"
#include "core/downloader/DeletionReconciler.hpp"
#include "utils/mocks.hpp"
#include "utils/test_helpers.hpp"

#include <mutex>
#include <vector>

namespace tapedeck::test {
namespace {

using namespace core::downloader;
using core::EventBus;
using namespace std::chrono_literals;

class DeletionReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_downloads = m_dir / "downloads";
        fs::create_directories(m_downloads);
        m_store = std::make_unique<JsonTaskStore>(m_dir / "downloads.json");
        ASSERT_TRUE(m_store->load());
        m_reconciler = std::make_unique<DeletionReconciler>(*m_store, m_downloads);

        for (auto event : {core::events::RecordingMarkedForDeletion, core::events::RecordingRestored}) {
            EventBus::instance().subscribe(event, [this, name = std::string(event)](const core::json& data) {
                std::lock_guard<std::mutex> lock(m_eventsMutex);
                m_events.push_back(name + ":" + data.at("recordingId").get<std::string>());
            });
        }
    }

    void TearDown() override {
        EventBus::instance().clear();
    }

    /**
     * Completed task with its file on disk
     */
    DownloadTask addCompleted(const std::string& recordingId, const std::string& filename, size_t size,
                              TimePoint lastAccess = Clock::now()) {
        DownloadTask task;
        task.id = makeTaskId(recordingId, filename);
        task.recordingId = recordingId;
        task.trackFilename = filename;
        task.status = DownloadStatus::Completed;
        task.totalBytes = size;
        task.bytesDownloaded = size;
        task.progressFraction = 1.0f;
        task.lastAccessTimestamp = lastAccess;
        auto path = writeFile(destinationPath(m_downloads, task), size);
        task.localPath = path.string();
        m_store->upsert(task);
        return task;
    }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(m_eventsMutex);
        return m_events;
    }

    TempDir m_dir;
    fs::path m_downloads;
    std::unique_ptr<JsonTaskStore> m_store;
    std::unique_ptr<DeletionReconciler> m_reconciler;

    std::mutex m_eventsMutex;
    std::vector<std::string> m_events;
};

TEST_F(DeletionReconcilerTest, MarkKeepsFileAndStatus) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();

    ASSERT_TRUE(m_reconciler->markForDeletion(task.id, t0));

    auto stored = m_store->get(task.id);
    EXPECT_TRUE(stored->isMarkedForDeletion);
    EXPECT_EQ(stored->deletionTimestamp, t0);
    EXPECT_EQ(stored->status, DownloadStatus::Completed);
    EXPECT_TRUE(fs::exists(*task.localPath));
    EXPECT_TRUE(m_reconciler->isRecordingMarked("gd1977"));
}

TEST_F(DeletionReconcilerTest, RemarkKeepsOriginalTimestamp) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();

    m_reconciler->markForDeletion(task.id, t0);
    m_reconciler->markForDeletion(task.id, t0 + 1h);

    EXPECT_EQ(m_store->get(task.id)->deletionTimestamp, t0);
}

TEST_F(DeletionReconcilerTest, MarkUnknownTask) {
    EXPECT_FALSE(m_reconciler->markForDeletion("nope"));
    EXPECT_FALSE(m_reconciler->restore("nope"));
}

TEST_F(DeletionReconcilerTest, RestoreClearsMarkAndRefreshesAccess) {
    auto old = Clock::now() - 48h;
    auto task = addCompleted("gd1977", "d1t01.mp3", 100, old);
    m_reconciler->markForDeletion(task.id);

    auto now = Clock::now();
    ASSERT_TRUE(m_reconciler->restore(task.id, now));

    auto stored = m_store->get(task.id);
    EXPECT_FALSE(stored->isMarkedForDeletion);
    EXPECT_FALSE(stored->deletionTimestamp.has_value());
    EXPECT_EQ(stored->lastAccessTimestamp, now);
    EXPECT_FALSE(m_reconciler->isRecordingMarked("gd1977"));
}

TEST_F(DeletionReconcilerTest, GraceBoundary) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    auto early = m_reconciler->cleanup(t0 + 7 * 24h - 1s, 7 * 24h);
    EXPECT_TRUE(early.removedIds.empty());
    EXPECT_EQ(early.pending, 1u);
    EXPECT_TRUE(fs::exists(*task.localPath));

    auto due = m_reconciler->cleanup(t0 + 7 * 24h, 7 * 24h);
    ASSERT_EQ(due.removedIds.size(), 1u);
    EXPECT_EQ(due.removedIds[0], task.id);
    EXPECT_EQ(due.freedBytes, 100u);
    EXPECT_FALSE(fs::exists(*task.localPath));
    EXPECT_FALSE(m_store->get(task.id).has_value());

    // Empty recording directory is pruned, the root stays
    EXPECT_FALSE(fs::exists(m_downloads / "gd1977"));
    EXPECT_TRUE(fs::exists(m_downloads));
}

TEST_F(DeletionReconcilerTest, RestoredTaskSurvivesCleanup) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);
    m_reconciler->restore(task.id, t0 + 1h);

    auto report = m_reconciler->cleanup(t0 + 30 * 24h, 7 * 24h);
    EXPECT_TRUE(report.removedIds.empty());
    EXPECT_EQ(report.pending, 0u);
    EXPECT_TRUE(m_store->get(task.id).has_value());
    EXPECT_TRUE(fs::exists(*task.localPath));
}

TEST_F(DeletionReconcilerTest, ZeroGraceRemovesImmediately) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    auto report = m_reconciler->cleanup(t0, Clock::duration::zero());
    EXPECT_EQ(report.removedIds.size(), 1u);
}

TEST_F(DeletionReconcilerTest, InFlightTaskDeferred) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    m_store->updateStatus(task.id, DownloadStatus::Downloading);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    auto report = m_reconciler->cleanup(t0 + 1h, 0s);
    EXPECT_TRUE(report.removedIds.empty());
    EXPECT_EQ(report.pending, 1u);
    EXPECT_TRUE(m_store->get(task.id).has_value());
}

TEST_F(DeletionReconcilerTest, RestoreDuringCleanupKeepsFileAndRecord) {
    using ::testing::_;

    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    ::testing::NiceMock<MockTaskStore> store;
    store.delegateTo(*m_store);
    DeletionReconciler cleaner(store, m_downloads);

    // The restore lands after cleanup listed the record, before it removes it
    EXPECT_CALL(store, removeIf(task.id, _))
        .WillOnce([&](const std::string& id, const ITaskStore::Predicate& due) {
            EXPECT_TRUE(m_reconciler->restore(task.id));
            return m_store->removeIf(id, due);
        });

    auto report = cleaner.cleanup(t0 + 1h, 0s);

    EXPECT_TRUE(report.removedIds.empty());
    EXPECT_EQ(report.freedBytes, 0u);
    EXPECT_TRUE(fs::exists(*task.localPath));
    auto stored = m_store->get(task.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->isMarkedForDeletion);
    EXPECT_EQ(stored->status, DownloadStatus::Completed);
}

TEST_F(DeletionReconcilerTest, MissingFileStillRemovesRecord) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    fs::remove(*task.localPath);
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    auto report = m_reconciler->cleanup(t0, 0s);
    EXPECT_EQ(report.removedIds.size(), 1u);
    EXPECT_TRUE(report.fileErrors.empty());
    EXPECT_EQ(report.freedBytes, 0u);
}

TEST_F(DeletionReconcilerTest, UndeletableFileReportedAndRecordRemoved) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    // A non-empty directory where the file should be cannot be removed
    fs::remove(*task.localPath);
    writeFile(fs::path(*task.localPath) / "inner.txt", std::string("x"));
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    auto report = m_reconciler->cleanup(t0, 0s);
    ASSERT_EQ(report.fileErrors.size(), 1u);
    EXPECT_EQ(report.fileErrors[0], task.id);
    EXPECT_EQ(report.removedIds.size(), 1u);
    EXPECT_FALSE(m_store->get(task.id).has_value());
}

TEST_F(DeletionReconcilerTest, PartialFileRemovedToo) {
    auto task = addCompleted("gd1977", "d1t01.mp3", 100);
    auto partial = partialPath(destinationPath(m_downloads, task));
    writeFile(partial, size_t(10));
    auto t0 = Clock::now();
    m_reconciler->markForDeletion(task.id, t0);

    m_reconciler->cleanup(t0, 0s);
    EXPECT_FALSE(fs::exists(partial));
}

TEST_F(DeletionReconcilerTest, RecordingLevelMarkAndRestore) {
    auto a = addCompleted("gd1977", "d1t01.mp3", 100);
    auto b = addCompleted("gd1977", "d1t02.mp3", 100);
    auto other = addCompleted("phish1995", "t01.ogg", 100);

    EXPECT_EQ(m_reconciler->markRecordingForDeletion("gd1977"), 2u);
    EXPECT_TRUE(m_store->get(a.id)->isMarkedForDeletion);
    EXPECT_TRUE(m_store->get(b.id)->isMarkedForDeletion);
    EXPECT_FALSE(m_store->get(other.id)->isMarkedForDeletion);

    EXPECT_EQ(m_reconciler->restoreRecording("gd1977"), 2u);
    EXPECT_FALSE(m_reconciler->isRecordingMarked("gd1977"));

    EXPECT_EQ(m_reconciler->markRecordingForDeletion("unknown"), 0u);
}

TEST_F(DeletionReconcilerTest, EventsOncePerRecording) {
    auto a = addCompleted("gd1977", "d1t01.mp3", 100);
    auto b = addCompleted("gd1977", "d1t02.mp3", 100);

    m_reconciler->markForDeletion(a.id);
    m_reconciler->markForDeletion(b.id);
    m_reconciler->restore(a.id);
    m_reconciler->restore(b.id);

    std::vector<std::string> expected{
        "recording.markedForDeletion:gd1977",
        "recording.restored:gd1977"
    };
    EXPECT_EQ(events(), expected);
}

TEST_F(DeletionReconcilerTest, EvictionCandidatesLeastRecentlyUsed) {
    auto now = Clock::now();
    addCompleted("gd1977", "new.mp3", 300, now);
    auto oldest = addCompleted("gd1977", "old.mp3", 300, now - 10h);
    auto middle = addCompleted("gd1977", "mid.mp3", 300, now - 5h);
    auto marked = addCompleted("gd1977", "gone.mp3", 300, now - 20h);
    m_reconciler->markForDeletion(marked.id);

    auto candidates = m_reconciler->evictionCandidates(500);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].id, oldest.id);
    EXPECT_EQ(candidates[1].id, middle.id);

    // Suggestions only
    EXPECT_FALSE(m_store->get(oldest.id)->isMarkedForDeletion);

    EXPECT_TRUE(m_reconciler->evictionCandidates(0).empty());
    EXPECT_EQ(m_reconciler->evictionCandidates(100000).size(), 3u);
}

} // namespace
} // namespace tapedeck::test
