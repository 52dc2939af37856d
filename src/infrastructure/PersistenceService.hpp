/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace ragforge::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Background worker that performs atomic file writes sequentially.
 *
 * Writes for the same file are applied in submission order, so the last
 * submitted content wins.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues text content to be written to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every queued write has been performed. */
    void flush();

    /** @brief Drains the queue and stops the worker thread. */
    void stop();

    /** @brief Writes content to filename via temp file and rename, on the calling thread. */
    static bool WriteAtomically(const std::string& filename, const std::string& content);

private:
    void workerLoop();

    std::queue<SaveTask> m_queue;
    std::size_t m_inFlight = 0;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace ragforge::infrastructure
