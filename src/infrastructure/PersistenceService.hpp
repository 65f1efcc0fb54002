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

namespace studytracker::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<bool> done; ///< Fulfilled with the write outcome.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Every write in the process goes through one queue and one worker, so two
 * whole-file rewrites can never interleave on disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a text content to be saved to a file.
     * @param filename Path to the file.
     * @param content The string content to write.
     * @return Future that becomes true once the file has been replaced.
     */
    std::future<bool> saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Queues a write and waits for it.
     * @return True if the file now holds @p content.
     */
    bool saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @return File contents, or nullopt if the file does not exist.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    std::optional<std::string> loadText(const std::string& filename) const;

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
     */
    bool performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace studytracker::infrastructure
