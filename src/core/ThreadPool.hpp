#pragma once

/**
 * ThreadPool.hpp
 *
 * Worker threads for running transfers. Admission control lives in the
 * scheduler; the pool only queues labelled jobs and runs them in order.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tapedeck::core {

class ThreadPool {
public:
    using Job = std::function<void()>;

    explicit ThreadPool(size_t numThreads) {
        ensureThreads(numThreads);
    }

    /**
     * Jobs already queued still run before the workers are joined
     */
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();
        for (auto& worker : m_workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Grow to at least numThreads workers. The pool never shrinks;
     * surplus workers just sleep.
     */
    void ensureThreads(size_t numThreads) {
        std::lock_guard<std::mutex> lock(m_mutex);
        while (!m_stopping && m_workers.size() < numThreads) {
            m_workers.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    /**
     * Queue a job
     * @param label Shown in the log if the job throws
     * @return false once the pool is shutting down
     */
    bool post(std::string label, Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return false;
            }
            m_queue.emplace_back(std::move(label), std::move(job));
        }
        m_wake.notify_one();
        return true;
    }

    /**
     * Block until the queue is empty and no job is running
     */
    void waitIdle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_queue.empty() && m_running == 0; });
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    size_t activeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        for (;;) {
            m_wake.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }

            auto [label, job] = std::move(m_queue.front());
            m_queue.pop_front();
            ++m_running;

            lock.unlock();
            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("Job '{}' failed: {}", label, e.what());
            }
            lock.lock();

            if (--m_running == 0 && m_queue.empty()) {
                m_idle.notify_all();
            }
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::deque<std::pair<std::string, Job>> m_queue;
    std::vector<std::thread> m_workers;
    size_t m_running{0};
    bool m_stopping{false};
};

} // namespace tapedeck::core
