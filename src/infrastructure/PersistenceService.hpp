/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes on a background worker.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>

namespace equilibra::infrastructure {

/**
 * @struct SaveTask
 * @brief A single queued file write.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns one worker thread that writes files in submission order.
 *
 * Every write lands in a temp file first and is renamed over the target,
 * so readers never observe a half-written document. Failures are reported
 * on std::cerr and counted, never thrown to callers.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues text content to be written to a file.
     * @param filename Target path; parent directories are created as needed.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has been attempted.
     * @return False if the timeout expired first.
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /** @brief Number of writes that failed since construction. */
    int failedWrites() const { return m_failedWrites.load(); }

    /** @brief Drains the queue and stops the worker. Safe to call twice. */
    void stop();

private:
    void workerLoop();

    /** @brief temp -> rename. Returns false on failure. */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    size_t m_inFlight = 0;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<int> m_failedWrites{0};
};

} // namespace equilibra::infrastructure
