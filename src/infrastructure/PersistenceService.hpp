/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic writer for playlist and rotation-state files.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace playoutplanner::infrastructure {

/**
 * @struct WriteRequest
 * @brief One pending file replacement.
 */
struct WriteRequest {
    std::string path;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns one worker thread that replaces files atomically, in queue order.
 *
 * Each request is written to "<path>.<n>.tmp" in the target directory and
 * renamed over the target, so readers never observe a half-written document.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a file replacement.
     * @param path Target file; missing parent directories are created.
     * @param content Complete new file content.
     */
    void saveTextAsync(const std::string& path, const std::string& content);

    /** @brief Blocks until every request queued so far has been performed. */
    void flush();

    /** @brief Drains the queue and joins the worker. Later requests are dropped. */
    void stop();

    /** @brief Requests that failed or were dropped since construction. */
    std::size_t failedWrites() const { return m_failedWrites.load(); }

    /** @brief Requests written successfully since construction. */
    std::size_t completedWrites() const { return m_completedWrites.load(); }

private:
    void run();
    std::optional<WriteRequest> nextRequest();
    void finishRequest(bool written);

    std::deque<WriteRequest> m_pending;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    bool m_busy = false;
    bool m_accepting = true;

    std::atomic<std::size_t> m_failedWrites{0};
    std::atomic<std::size_t> m_completedWrites{0};
    std::thread m_worker;
};

} // namespace playoutplanner::infrastructure
