/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic writes of layout results and caches.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace regionwalker::infrastructure {

/**
 * @class PersistenceService
 * @brief One background thread that writes files atomically, one at a time.
 *
 * Writes queued for the same file before the worker reaches it are merged:
 * only the newest content is written. Re-arranging a canvas several times in
 * a row therefore costs one write, and two writers never interleave on a file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues content for filename, replacing any still-queued content for it.
     *
     * After stop() the write is refused and counted as failed.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every queued write has been attempted. */
    void flush();

    /** @brief Number of writes that failed since construction. */
    int failedWrites() const { return m_failedWrites.load(); }

    /** @brief Drains the queue, then joins the worker. Idempotent. */
    void stop();

    /**
     * @brief Writes content to a temp file beside filename, then renames it into place.
     * @return false (after logging) when any step fails; the target is left untouched.
     */
    static bool writeAtomic(const std::string& filename, const std::string& content);

private:
    void workerLoop();

    std::map<std::string, std::string> m_pending; ///< filename -> newest content
    std::deque<std::string> m_order;              ///< filenames in first-queued order
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_drained;
    bool m_writing = false;
    bool m_accepting = true;

    std::thread m_worker;
    std::atomic<int> m_failedWrites{0};
};

} // namespace regionwalker::infrastructure
