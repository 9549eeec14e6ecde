/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <future>
#include <optional>

namespace casefile::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation and its completion signal.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<void> done;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes pass through one serialized queue. Each write lands completely
 * (temp file + rename) or not at all.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     * @return Future that becomes ready after the rename, or holds a
     *         PersistenceError if the write failed or the service is stopped.
     */
    std::future<void> saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @return nullopt when the file does not exist.
     * @throws PersistenceError when the file exists but cannot be read.
     */
    std::optional<std::string> readText(const std::string& filename) const;

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @throws PersistenceError on any I/O failure; the temp file is removed.
     */
    void performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace casefile::infrastructure
