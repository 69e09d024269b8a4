/**
 * TaskStore.cpp
 *
 * JSON document implementation of the task store.
 */

#include "TaskStore.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>

namespace tapedeck::core::downloader {

namespace {
constexpr int kDocumentVersion = 1;
}

JsonTaskStore::JsonTaskStore(std::filesystem::path path, std::chrono::milliseconds progressFlushInterval)
    : m_path(std::move(path))
    , m_progressFlushInterval(progressFlushInterval)
    , m_lastFlush(std::chrono::steady_clock::now()) {
}

JsonTaskStore::~JsonTaskStore() {
    try {
        flush();
    } catch (const PersistenceError& e) {
        Logger::instance().error("Final progress checkpoint lost: {}", e.what());
    }
}

bool JsonTaskStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_tasks.clear();
    m_nextSequence = 1;

    if (!utils::FileUtils::fileExists(m_path)) {
        Logger::instance().info("No task store at {}, starting empty", m_path.string());
        return true;
    }

    try {
        auto content = utils::FileUtils::readFile(m_path);
        if (!content) {
            throw PersistenceError("cannot read " + m_path.string());
        }

        auto doc = json::parse(*content);
        for (const auto& item : doc.at("tasks")) {
            auto task = item.get<DownloadTask>();
            m_nextSequence = std::max(m_nextSequence, task.enqueueSequence + 1);
            m_tasks[task.id] = std::move(task);
        }
        m_nextSequence = std::max(m_nextSequence, doc.value("nextSequence", uint64_t(1)));

        Logger::instance().info("Loaded {} download tasks from {}", m_tasks.size(), m_path.string());
        return true;

    } catch (const std::exception& e) {
        Logger::instance().error("Task store {} is unreadable: {}", m_path.string(), e.what());

        auto corruptPath = m_path;
        corruptPath += ".corrupt";
        if (!utils::FileUtils::moveFile(m_path, corruptPath)) {
            Logger::instance().warn("Could not move corrupt store aside to {}", corruptPath.string());
        }
        m_tasks.clear();
        m_nextSequence = 1;
        return false;
    }
}

void JsonTaskStore::upsert(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto previous = m_tasks.find(task.id);
    std::optional<DownloadTask> backup;
    if (previous != m_tasks.end()) {
        backup = previous->second;
    }

    DownloadTask record = task;
    if (record.enqueueSequence == 0) {
        record.enqueueSequence = m_nextSequence++;
    }
    m_tasks[record.id] = std::move(record);

    try {
        persistLocked();
    } catch (const PersistenceError&) {
        if (backup) {
            m_tasks[task.id] = *backup;
        } else {
            m_tasks.erase(task.id);
        }
        throw;
    }
}

std::optional<DownloadTask> JsonTaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DownloadTask> JsonTaskStore::listAll() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return selectLocked([](const DownloadTask&) { return true; });
}

std::vector<DownloadTask> JsonTaskStore::listByStatus(DownloadStatus status) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return selectLocked([status](const DownloadTask& t) { return t.status == status; });
}

std::vector<DownloadTask> JsonTaskStore::listByRecording(const std::string& recordingId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return selectLocked([&recordingId](const DownloadTask& t) { return t.recordingId == recordingId; });
}

std::vector<DownloadTask> JsonTaskStore::listMarkedForDeletion() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return selectLocked([](const DownloadTask& t) { return t.isMarkedForDeletion; });
}

bool JsonTaskStore::updateProgress(const std::string& id, std::optional<float> fraction,
                                   uint64_t bytesDownloaded, uint64_t totalBytes) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    auto& task = it->second;
    if (task.status != DownloadStatus::Downloading) {
        // Late report from a transfer that was paused or cancelled meanwhile
        return false;
    }
    if (totalBytes > 0) {
        task.totalBytes = totalBytes;
    }
    if (task.hasKnownSize() && bytesDownloaded > task.totalBytes) {
        bytesDownloaded = task.totalBytes;
    }
    task.bytesDownloaded = bytesDownloaded;
    if (fraction) {
        task.progressFraction = std::clamp(*fraction, 0.0f, 1.0f);
    } else {
        task.progressFraction = std::nullopt;
    }
    m_progressDirty = true;

    auto now = std::chrono::steady_clock::now();
    if (now - m_lastFlush >= m_progressFlushInterval) {
        try {
            persistLocked();
        } catch (const PersistenceError& e) {
            // The value stays in memory and goes out with the next successful write
            Logger::instance().warn("Progress checkpoint failed: {}", e.what());
        }
    }
    return true;
}

void JsonTaskStore::applyStatus(DownloadTask& task, DownloadStatus status,
                                const std::optional<std::string>& errorMessage) {
    task.status = status;
    task.errorMessage = errorMessage;
    if (status == DownloadStatus::Completed) {
        task.completedAt = Clock::now();
    }
    if (status == DownloadStatus::Failed) {
        task.lastFailureAt = Clock::now();
    }
}

bool JsonTaskStore::updateStatus(const std::string& id, DownloadStatus status,
                                 const std::optional<std::string>& errorMessage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return commitLocked(id, [&](DownloadTask& task) {
        applyStatus(task, status, errorMessage);
        return true;
    });
}

bool JsonTaskStore::compareAndSetStatus(const std::string& id, DownloadStatus expected,
                                        DownloadStatus desired,
                                        const std::optional<std::string>& errorMessage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return commitLocked(id, [&](DownloadTask& task) {
        if (task.status != expected) {
            return false;
        }
        applyStatus(task, desired, errorMessage);
        return true;
    });
}

bool JsonTaskStore::modify(const std::string& id, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return commitLocked(id, mutator);
}

bool JsonTaskStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    DownloadTask backup = it->second;
    m_tasks.erase(it);

    try {
        persistLocked();
    } catch (const PersistenceError&) {
        m_tasks[id] = std::move(backup);
        throw;
    }
    return true;
}

std::optional<DownloadTask> JsonTaskStore::removeIf(const std::string& id, const Predicate& predicate) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_tasks.find(id);
    if (it == m_tasks.end() || !predicate(it->second)) {
        return std::nullopt;
    }

    DownloadTask removed = std::move(it->second);
    m_tasks.erase(it);

    try {
        persistLocked();
    } catch (const PersistenceError&) {
        m_tasks[id] = std::move(removed);
        throw;
    }
    return removed;
}

size_t JsonTaskStore::countByStatus(DownloadStatus status) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
        [status](const auto& entry) { return entry.second.status == status; }));
}

uint64_t JsonTaskStore::totalBytesDownloaded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t total = 0;
    for (const auto& [id, task] : m_tasks) {
        total += task.bytesDownloaded;
    }
    return total;
}

uint64_t JsonTaskStore::allocateSequence() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nextSequence++;
}

void JsonTaskStore::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_progressDirty) {
        persistLocked();
    }
}

bool JsonTaskStore::commitLocked(const std::string& id, const Mutator& mutator) {
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    DownloadTask backup = it->second;
    if (!mutator(it->second)) {
        it->second = std::move(backup);
        return false;
    }

    try {
        persistLocked();
    } catch (const PersistenceError&) {
        m_tasks[id] = std::move(backup);
        throw;
    }
    return true;
}

void JsonTaskStore::persistLocked() {
    std::string content;
    try {
        json tasks = json::array();
        for (const auto& [id, task] : m_tasks) {
            tasks.push_back(task);
        }

        json doc = {
            {"version", kDocumentVersion},
            {"nextSequence", m_nextSequence},
            {"tasks", std::move(tasks)}
        };
        content = doc.dump(2);
    } catch (const json::exception& e) {
        // e.g. a field that is not valid UTF-8; the caller rolls the record back
        throw PersistenceError(std::string("cannot serialize task store: ") + e.what());
    }

    if (!utils::FileUtils::writeFileAtomic(m_path, content)) {
        throw PersistenceError("failed to write " + m_path.string());
    }

    m_progressDirty = false;
    m_lastFlush = std::chrono::steady_clock::now();
}

} // namespace tapedeck::core::downloader
