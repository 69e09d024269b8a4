/**
 * @file test_task_store.cpp
 * @brief Unit tests for JsonTaskStore
 */

#include <gtest/gtest.h>

#include "core/downloader/TaskStore.hpp"
#include "utils/test_helpers.hpp"

namespace tapedeck::test {
namespace {

using namespace core::downloader;

DownloadTask makeTask(const std::string& recordingId, const std::string& filename, uint64_t totalBytes = 1000) {
    DownloadTask task;
    task.id = makeTaskId(recordingId, filename);
    task.recordingId = recordingId;
    task.trackFilename = filename;
    task.sourceUrl = "https://archive.example/download/" + filename;
    task.format = "VBR MP3";
    task.totalBytes = totalBytes;
    return task;
}

class JsonTaskStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_storePath = m_dir / "state" / "downloads.json";
        m_store = std::make_unique<JsonTaskStore>(m_storePath, std::chrono::milliseconds(0));
        ASSERT_TRUE(m_store->load());
    }

    /**
     * Make every following write fail: the state directory becomes a file
     */
    void breakStorage() {
        fs::remove_all(m_dir / "state");
        writeFile(m_dir / "state", std::string("not a directory"));
    }

    TempDir m_dir;
    fs::path m_storePath;
    std::unique_ptr<JsonTaskStore> m_store;
};

TEST_F(JsonTaskStoreTest, UpsertAndGet) {
    m_store->upsert(makeTask("gd1977", "d1t01.mp3"));

    auto task = m_store->get(makeTaskId("gd1977", "d1t01.mp3"));
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->recordingId, "gd1977");
    EXPECT_EQ(task->trackFilename, "d1t01.mp3");
    EXPECT_EQ(task->status, DownloadStatus::Queued);
    EXPECT_EQ(task->totalBytes, 1000u);

    EXPECT_FALSE(m_store->get("missing").has_value());
}

TEST_F(JsonTaskStoreTest, UpsertReplacesById) {
    auto task = makeTask("gd1977", "d1t01.mp3");
    m_store->upsert(task);

    task.priority = 7;
    task.enqueueSequence = m_store->get(task.id)->enqueueSequence;
    m_store->upsert(task);

    EXPECT_EQ(m_store->listAll().size(), 1u);
    EXPECT_EQ(m_store->get(task.id)->priority, 7);
}

TEST_F(JsonTaskStoreTest, SequenceAssignedInInsertionOrder) {
    m_store->upsert(makeTask("gd1977", "a.mp3"));
    m_store->upsert(makeTask("gd1977", "b.mp3"));

    auto a = m_store->get(makeTaskId("gd1977", "a.mp3"))->enqueueSequence;
    auto b = m_store->get(makeTaskId("gd1977", "b.mp3"))->enqueueSequence;
    EXPECT_GT(a, 0u);
    EXPECT_LT(a, b);
    EXPECT_GT(m_store->allocateSequence(), b);
}

TEST_F(JsonTaskStoreTest, ListFilters) {
    auto a = makeTask("gd1977", "a.mp3");
    auto b = makeTask("gd1977", "b.mp3");
    auto c = makeTask("phish1995", "c.mp3");
    b.status = DownloadStatus::Failed;
    c.isMarkedForDeletion = true;
    c.deletionTimestamp = Clock::now();
    m_store->upsert(a);
    m_store->upsert(b);
    m_store->upsert(c);

    EXPECT_EQ(m_store->listAll().size(), 3u);
    EXPECT_EQ(m_store->listByStatus(DownloadStatus::Queued).size(), 2u);
    EXPECT_EQ(m_store->listByStatus(DownloadStatus::Failed).size(), 1u);
    EXPECT_EQ(m_store->listByRecording("gd1977").size(), 2u);
    ASSERT_EQ(m_store->listMarkedForDeletion().size(), 1u);
    EXPECT_EQ(m_store->listMarkedForDeletion()[0].id, c.id);
    EXPECT_EQ(m_store->countByStatus(DownloadStatus::Queued), 2u);
    EXPECT_EQ(m_store->countByStatus(DownloadStatus::Completed), 0u);
}

TEST_F(JsonTaskStoreTest, UpdateProgressClampsToTotal) {
    auto task = makeTask("gd1977", "a.mp3", 1000);
    task.status = DownloadStatus::Downloading;
    m_store->upsert(task);

    EXPECT_TRUE(m_store->updateProgress(task.id, 1.5f, 5000));

    auto stored = m_store->get(task.id);
    EXPECT_EQ(stored->bytesDownloaded, 1000u);
    ASSERT_TRUE(stored->progressFraction.has_value());
    EXPECT_FLOAT_EQ(*stored->progressFraction, 1.0f);
}

TEST_F(JsonTaskStoreTest, UpdateProgressLearnsTotalSize) {
    auto task = makeTask("gd1977", "a.mp3", 0);
    task.status = DownloadStatus::Downloading;
    task.progressFraction.reset();
    m_store->upsert(task);

    EXPECT_TRUE(m_store->updateProgress(task.id, std::nullopt, 100));
    EXPECT_FALSE(m_store->get(task.id)->progressFraction.has_value());

    EXPECT_TRUE(m_store->updateProgress(task.id, 0.25f, 250, 1000));
    auto stored = m_store->get(task.id);
    EXPECT_EQ(stored->totalBytes, 1000u);
    EXPECT_FLOAT_EQ(stored->progressFraction.value_or(-1.0f), 0.25f);
}

TEST_F(JsonTaskStoreTest, UpdateProgressIgnoredUnlessDownloading) {
    auto task = makeTask("gd1977", "a.mp3");
    task.status = DownloadStatus::Paused;
    task.bytesDownloaded = 300;
    m_store->upsert(task);

    EXPECT_FALSE(m_store->updateProgress(task.id, 0.9f, 900));
    EXPECT_EQ(m_store->get(task.id)->bytesDownloaded, 300u);

    EXPECT_FALSE(m_store->updateProgress("missing", 0.5f, 1));
}

TEST_F(JsonTaskStoreTest, UpdateStatusStampsTimes) {
    auto task = makeTask("gd1977", "a.mp3");
    m_store->upsert(task);

    EXPECT_TRUE(m_store->updateStatus(task.id, DownloadStatus::Failed, std::string("timeout")));
    auto failed = m_store->get(task.id);
    EXPECT_EQ(failed->status, DownloadStatus::Failed);
    EXPECT_EQ(failed->errorMessage.value_or(""), "timeout");
    EXPECT_TRUE(failed->lastFailureAt.has_value());

    EXPECT_TRUE(m_store->updateStatus(task.id, DownloadStatus::Completed));
    auto completed = m_store->get(task.id);
    EXPECT_FALSE(completed->errorMessage.has_value());
    EXPECT_TRUE(completed->completedAt.has_value());

    EXPECT_FALSE(m_store->updateStatus("missing", DownloadStatus::Queued));
}

TEST_F(JsonTaskStoreTest, CompareAndSetOnlyFromExpected) {
    auto task = makeTask("gd1977", "a.mp3");
    task.status = DownloadStatus::Paused;
    m_store->upsert(task);

    // A late failure report from a transfer that was paused meanwhile
    EXPECT_FALSE(m_store->compareAndSetStatus(task.id, DownloadStatus::Downloading, DownloadStatus::Failed,
                                              std::string("late")));
    EXPECT_EQ(m_store->get(task.id)->status, DownloadStatus::Paused);

    EXPECT_TRUE(m_store->compareAndSetStatus(task.id, DownloadStatus::Paused, DownloadStatus::Queued));
    EXPECT_EQ(m_store->get(task.id)->status, DownloadStatus::Queued);
}

TEST_F(JsonTaskStoreTest, ModifyAbortLeavesRecordUntouched) {
    auto task = makeTask("gd1977", "a.mp3");
    m_store->upsert(task);

    bool committed = m_store->modify(task.id, [](DownloadTask& t) {
        t.priority = 99;
        return false;
    });

    EXPECT_FALSE(committed);
    EXPECT_EQ(m_store->get(task.id)->priority, 0);
    EXPECT_FALSE(m_store->modify("missing", [](DownloadTask&) { return true; }));
}

TEST_F(JsonTaskStoreTest, Remove) {
    auto task = makeTask("gd1977", "a.mp3");
    m_store->upsert(task);

    EXPECT_TRUE(m_store->remove(task.id));
    EXPECT_FALSE(m_store->get(task.id).has_value());
    EXPECT_FALSE(m_store->remove(task.id));
}

TEST_F(JsonTaskStoreTest, TotalBytesDownloaded) {
    auto a = makeTask("gd1977", "a.mp3");
    auto b = makeTask("gd1977", "b.mp3");
    a.bytesDownloaded = 400;
    b.bytesDownloaded = 600;
    m_store->upsert(a);
    m_store->upsert(b);

    EXPECT_EQ(m_store->totalBytesDownloaded(), 1000u);
}

TEST_F(JsonTaskStoreTest, SurvivesReload) {
    auto task = makeTask("gd1977", "d1t01.mp3");
    task.priority = 3;
    task.retryCount = 2;
    task.sha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
    task.isMarkedForDeletion = true;
    task.deletionTimestamp = Clock::now();
    m_store->upsert(task);
    auto sequence = m_store->get(task.id)->enqueueSequence;

    JsonTaskStore reloaded(m_storePath);
    ASSERT_TRUE(reloaded.load());

    auto stored = reloaded.get(task.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->priority, 3);
    EXPECT_EQ(stored->retryCount, 2);
    EXPECT_EQ(stored->sha1, task.sha1);
    EXPECT_EQ(stored->enqueueSequence, sequence);
    EXPECT_TRUE(stored->isMarkedForDeletion);
    EXPECT_EQ(toEpochMillis(*stored->deletionTimestamp), toEpochMillis(*task.deletionTimestamp));

    // Sequence numbers keep growing across restarts
    EXPECT_GT(reloaded.allocateSequence(), sequence);
}

TEST_F(JsonTaskStoreTest, ProgressCheckpointedOnFlush) {
    auto slowPath = m_dir / "slow" / "downloads.json";
    auto task = makeTask("gd1977", "a.mp3", 1000);
    task.status = DownloadStatus::Downloading;
    {
        JsonTaskStore store(slowPath, std::chrono::hours(1));
        store.load();
        store.upsert(task);
        store.updateProgress(task.id, 0.5f, 500);

        JsonTaskStore before(slowPath);
        before.load();
        EXPECT_EQ(before.get(task.id)->bytesDownloaded, 0u);

        store.flush();
    }

    JsonTaskStore after(slowPath);
    after.load();
    EXPECT_EQ(after.get(task.id)->bytesDownloaded, 500u);
}

TEST_F(JsonTaskStoreTest, CorruptFileMovedAside) {
    auto path = m_dir / "corrupt" / "downloads.json";
    writeFile(path, std::string("{ this is not json"));

    JsonTaskStore store(path);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.listAll().empty());

    auto aside = path;
    aside += ".corrupt";
    EXPECT_TRUE(fs::exists(aside));
    EXPECT_FALSE(fs::exists(path));

    // The store is usable again
    store.upsert(makeTask("gd1977", "a.mp3"));
    EXPECT_EQ(store.listAll().size(), 1u);
}

TEST_F(JsonTaskStoreTest, FailedWriteRollsBack) {
    auto task = makeTask("gd1977", "a.mp3");
    m_store->upsert(task);

    breakStorage();

    EXPECT_THROW(m_store->updateStatus(task.id, DownloadStatus::Cancelled), PersistenceError);
    EXPECT_EQ(m_store->get(task.id)->status, DownloadStatus::Queued);

    EXPECT_THROW(m_store->upsert(makeTask("gd1977", "b.mp3")), PersistenceError);
    EXPECT_FALSE(m_store->get(makeTaskId("gd1977", "b.mp3")).has_value());

    EXPECT_THROW(m_store->remove(task.id), PersistenceError);
    EXPECT_TRUE(m_store->get(task.id).has_value());
}

TEST_F(JsonTaskStoreTest, InvalidUtf8RecordRejectedAndRolledBack) {
    auto good = makeTask("gd1977", "a.mp3");
    m_store->upsert(good);

    auto bad = makeTask("rec\xff", "d1t01.mp3");
    EXPECT_THROW(m_store->upsert(bad), PersistenceError);
    EXPECT_FALSE(m_store->get(bad.id).has_value());

    EXPECT_THROW(m_store->modify(good.id, [](DownloadTask& t) {
        t.errorMessage = std::string("bad byte \xfe");
        return true;
    }), PersistenceError);
    EXPECT_FALSE(m_store->get(good.id)->errorMessage.has_value());

    // Later writes are unaffected
    m_store->upsert(makeTask("gd1977", "b.mp3"));
    m_store->flush();

    JsonTaskStore reloaded(m_storePath);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.listAll().size(), 2u);
}

TEST_F(JsonTaskStoreTest, PersistenceRetryGivesUpAfterSecondFailure) {
    auto task = makeTask("gd1977", "a.mp3");
    m_store->upsert(task);
    breakStorage();

    int attempts = 0;
    auto result = withPersistenceRetry("test", [&] {
        ++attempts;
        return m_store->updateStatus(task.id, DownloadStatus::Paused);
    });

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(attempts, 2);
}

TEST(DownloadTaskTest, TransitionTable) {
    EXPECT_TRUE(isValidTransition(DownloadStatus::Queued, DownloadStatus::Downloading));
    EXPECT_TRUE(isValidTransition(DownloadStatus::Downloading, DownloadStatus::Completed));
    EXPECT_TRUE(isValidTransition(DownloadStatus::Paused, DownloadStatus::Cancelled));
    EXPECT_TRUE(isValidTransition(DownloadStatus::Failed, DownloadStatus::Queued));
    EXPECT_TRUE(isValidTransition(DownloadStatus::Cancelled, DownloadStatus::Queued));

    EXPECT_FALSE(isValidTransition(DownloadStatus::Completed, DownloadStatus::Queued));
    EXPECT_FALSE(isValidTransition(DownloadStatus::Queued, DownloadStatus::Completed));
    EXPECT_FALSE(isValidTransition(DownloadStatus::Paused, DownloadStatus::Downloading));
    EXPECT_FALSE(isValidTransition(DownloadStatus::Queued, DownloadStatus::Queued));
}

TEST(DownloadTaskTest, IdsAndPaths) {
    EXPECT_EQ(makeTaskId("gd1977", "d1t01.mp3"), makeTaskId("gd1977", "d1t01.mp3"));
    EXPECT_NE(makeTaskId("gd1977", "d1t01.mp3"), makeTaskId("gd1977", "d1t02.mp3"));
    EXPECT_EQ(makeTaskId("gd1977", "d1t01.mp3"), "gd1977_d1t01.mp3");
    EXPECT_NE(makeTaskId("a_b", "c"), makeTaskId("a", "b_c"));
    EXPECT_NE(makeTaskId("a%5F", "c"), makeTaskId("a_", "c"));

    DownloadTask task;
    task.recordingId = "gd/1977";
    task.trackFilename = "../d1t01.mp3";
    auto path = destinationPath("/music", task);
    EXPECT_EQ(path.parent_path().parent_path(), fs::path("/music"));
    EXPECT_EQ(partialPath(path).string(), path.string() + ".part");
}

TEST(DownloadTaskTest, StatusNames) {
    EXPECT_STREQ(toString(DownloadStatus::Downloading), "DOWNLOADING");
    EXPECT_EQ(parseStatus("CANCELLED").value_or(DownloadStatus::Queued), DownloadStatus::Cancelled);
    EXPECT_FALSE(parseStatus("EXPLODED").has_value());
}

} // namespace
} // namespace tapedeck::test
