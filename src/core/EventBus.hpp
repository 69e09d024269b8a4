#pragma once

/**
 * EventBus.hpp
 *
 * In-process notification of download state changes. The engine emits
 * named events with a JSON payload; observers subscribe to one name or
 * to a whole namespace ("download.*").
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tapedeck::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;
using EventHandler = std::function<void(const std::string& event, const json&)>;

/**
 * Well-known event names
 */
namespace events {
inline constexpr const char* DownloadStatus = "download.status";
inline constexpr const char* DownloadProgress = "download.progress";
inline constexpr const char* RecordingCompleted = "recording.completed";
inline constexpr const char* RecordingMarkedForDeletion = "recording.markedForDeletion";
inline constexpr const char* RecordingRestored = "recording.restored";
inline constexpr const char* StorageLow = "storage.low";
inline constexpr const char* StorageInsufficient = "storage.insufficient";
inline constexpr const char* AppInitialized = "app.initialized";
inline constexpr const char* AppShutdown = "app.shutdown";
} // namespace events

/**
 * Handle returned by subscribe; cancelled handles are skipped on emit
 * even before the bus has dropped them.
 */
class Subscription {
public:
    Subscription(uint64_t id, std::string pattern)
        : m_id(id), m_pattern(std::move(pattern)) {}

    uint64_t getId() const { return m_id; }
    const std::string& getPattern() const { return m_pattern; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_pattern;
    std::atomic<bool> m_active{true};
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

class EventBus {
public:
    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    /**
     * Subscribe to a single event name
     */
    SubscriptionPtr subscribe(const std::string& event, EventCallback callback) {
        return add(event, false, [callback = std::move(callback)](const std::string&, const json& data) {
            callback(data);
        });
    }

    /**
     * Subscribe to every event whose name starts with prefix + "."
     * @param prefix Namespace such as "download" or "recording"
     */
    SubscriptionPtr subscribeNamespace(const std::string& prefix, EventHandler handler) {
        return add(prefix + ".", true, std::move(handler));
    }

    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) {
            return;
        }
        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it->subscription->getId() == subscription->getId()) {
                m_entries.erase(it);
                break;
            }
        }
    }

    /**
     * Deliver on the calling thread, outside the lock. A throwing
     * subscriber is logged and the remaining ones still run.
     */
    void emit(const std::string& event, const json& data = json::object()) {
        std::vector<std::pair<SubscriptionPtr, EventHandler>> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& entry : m_entries) {
                if (matches(entry, event)) {
                    targets.emplace_back(entry.subscription, entry.handler);
                }
            }
        }

        for (const auto& [subscription, handler] : targets) {
            if (!subscription->isActive()) {
                continue;
            }
            try {
                handler(event, data);
            } catch (const std::exception& e) {
                Logger::instance().warn("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_entries) {
            entry.subscription->cancel();
        }
        m_entries.clear();
    }

private:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    struct Entry {
        bool isNamespace;
        EventHandler handler;
        SubscriptionPtr subscription;
    };

    SubscriptionPtr add(std::string pattern, bool isNamespace, EventHandler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto subscription = std::make_shared<Subscription>(m_nextId++, std::move(pattern));
        m_entries.push_back({isNamespace, std::move(handler), subscription});
        return subscription;
    }

    static bool matches(const Entry& entry, const std::string& event) {
        const auto& pattern = entry.subscription->getPattern();
        if (entry.isNamespace) {
            return event.compare(0, pattern.size(), pattern) == 0;
        }
        return event == pattern;
    }

    std::mutex m_mutex;
    std::vector<Entry> m_entries;
    uint64_t m_nextId{1};
};

/**
 * Unsubscribes when it goes out of scope
 */
class ScopedSubscription {
public:
    explicit ScopedSubscription(SubscriptionPtr subscription)
        : m_subscription(std::move(subscription)) {}
    ~ScopedSubscription() {
        EventBus::instance().unsubscribe(m_subscription);
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    SubscriptionPtr m_subscription;
};

} // namespace tapedeck::core
