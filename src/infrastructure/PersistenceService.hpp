/**
 * @file PersistenceService.hpp
 * @brief Write-behind worker that rewrites ledger files atomically, in submission order.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cstddef>

namespace taskledger::infrastructure {

/**
 * @struct WriteRequest
 * @brief Full replacement content for one file.
 */
struct WriteRequest {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns a single background thread that performs atomic file rewrites sequentially.
 *
 * Requests are processed strictly in FIFO order, so a caller that queues the
 * record table before the owner index gets the same order on disk.
 * After the first failed write every later request is dropped (and counted),
 * so the files on disk stay at the last state that was fully written in order.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a whole-file rewrite.
     * @param filename Target path. Parent directories are created as needed.
     * @param content The complete new file content.
     *
     * After stop() the write is performed on the calling thread.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every request queued so far has been written (or has failed).
     */
    void flush();

    /**
     * @brief Drains the queue and joins the worker thread.
     */
    void stop();

    /** @brief Number of writes that failed or were dropped after a failure. */
    std::size_t failedWrites() const { return m_failedWrites.load(); }

    /** @brief False once any write has failed. */
    bool healthy() const { return m_failedWrites.load() == 0; }

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     * @return false if the target was left untouched.
     */
    bool performAtomicWrite(const WriteRequest& request);

    /** @brief Writes the request unless an earlier one failed. */
    bool process(const WriteRequest& request);

    std::queue<WriteRequest> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<std::size_t> m_failedWrites{0};
};

} // namespace taskledger::infrastructure
