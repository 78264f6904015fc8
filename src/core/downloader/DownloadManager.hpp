#pragma once

/**
 * DownloadManager.hpp
 *
 * Concurrent track download queue: a fixed pool of workers draining a
 * bounded FIFO, with cancel-by-id, cooperative pause/resume and bulk
 * retry of failures.
 */

#include "BoundedQueue.hpp"
#include "DownloadErrors.hpp"
#include "DownloadEvent.hpp"
#include "DownloadJob.hpp"
#include "TrackFetcher.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace trackdl::core::downloader {

/**
 * Progress sink, invoked once per state transition.
 * `queued` is reported from the enqueuing thread, everything else from
 * the worker that owns the job. Exceptions are caught and logged.
 *
 * The sink may call back into the manager, including stop(). When it
 * runs on a worker, stop() only requests the shutdown; the workers are
 * joined by the next start(), stop() or the destructor on another thread.
 */
using DownloadProgressCallback = std::function<void(
    const std::string& trackId,
    DownloadState state,
    const std::optional<DownloadResult>& result
)>;

/**
 * Construction parameters
 */
struct DownloadManagerOptions {
    // <= 0 selects the default; values above the maximum are clamped
    int workerCount{3};

    size_t queueCapacity{1000};

    /**
     * Read downloads.concurrentDownloads and downloads.queueCapacity
     * from Config::instance()
     */
    static DownloadManagerOptions fromConfig();
};

/**
 * DownloadManager - bounded worker pool for track downloads
 *
 * Per job the listener sees `queued` strictly before `downloading`, and
 * exactly one terminal event (`completed`, `error` or `cancelled`).
 * Dispatch is FIFO; completion order is whatever the fetches produce.
 *
 * Pausing only stops workers from starting their next job. Cancellation
 * is checked right before and right after the fetch call; a fetch that
 * finishes after its token was signaled is reported as cancelled even
 * if the file was written.
 */
class DownloadManager {
public:
    static constexpr int kDefaultWorkers = 3;
    static constexpr int kMaxWorkers = 10;

    /**
     * @param fetcher Performs the transfers; must not be null
     * @param options Worker count and queue capacity
     * @param progressCallback Lifecycle sink (optional)
     * @throws std::invalid_argument if fetcher is null or capacity is 0
     */
    DownloadManager(
        TrackFetcherPtr fetcher,
        DownloadManagerOptions options = {},
        DownloadProgressCallback progressCallback = nullptr
    );

    /**
     * Stops the pool and joins every worker
     */
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Spawn the workers. No-op while already running. Joins workers left
     * over from a stop() requested by one of them.
     * @throws std::logic_error when called from one of this manager's workers
     */
    void start();

    /**
     * Stop accepting work, release paused workers and wait for every
     * worker to exit. Fetches in flight finish first; queued jobs that
     * never reached a worker are dropped. No-op while stopped.
     * From a worker thread the call returns without joining.
     */
    void stop();

    /**
     * Add a job. `queued` is reported before the job becomes visible to
     * the workers, then the call blocks while the queue is full.
     * @throws NotRunningError if the manager is stopped, or is stopped
     *         while this call waits for space (the job is dropped)
     */
    void enqueue(const DownloadJob& job);

    /**
     * Enqueue each job, skipping the ones that fail
     * @return Number of jobs admitted
     */
    size_t enqueueMany(const std::vector<DownloadJob>& jobs);

    /**
     * Signal the cancellation token of an executing job
     * @throws JobNotActiveError unless the job is currently executing
     */
    void cancelDownload(const std::string& trackId);

    /**
     * @return false if already paused
     */
    bool pauseQueue();

    /**
     * Wake every worker waiting at the pause gate
     * @return false if not paused
     */
    bool resumeQueue();

    /**
     * Take every failed job out of the failed list and queue a fresh
     * copy of it. Jobs that cannot be re-admitted are dropped.
     * @return Number of jobs queued again
     */
    size_t retryAllFailed();

    /**
     * Forget all failed jobs
     * @return Number of entries removed
     */
    size_t clearFailed();

    size_t getActiveCount() const;
    size_t getQueueLength() const;
    size_t getFailedCount() const;
    bool isRunning() const;
    bool isPaused() const;
    int getWorkerCount() const { return m_workerCount; }

    /**
     * True when called from one of this manager's worker threads, i.e.
     * from the progress sink for anything but `queued`
     */
    bool isWorkerThread() const;

    QueueStatus getStatus() const;

    /**
     * Copies of the jobs in the failed list
     */
    std::vector<DownloadJob> getFailedJobs() const;

    /**
     * Block until every admitted job has reached a terminal state or
     * been dropped by stop()
     */
    void waitForAll();

    /**
     * @return false on timeout
     */
    bool waitForAll(std::chrono::milliseconds timeout);

private:
    // Flip to stopped, wake the gate and drop queued jobs; no joining
    void requestStop();
    void joinWorkers();

    void workerLoop(int workerId);
    void processDownload(const DownloadJob& job, int workerId);
    DownloadResult executeFetch(const DownloadJob& job);

    void notify(const std::string& trackId, DownloadState state,
                const std::optional<DownloadResult>& result = std::nullopt);

    // Decrement the outstanding count and wake waitForAll()
    void finishJob(size_t count = 1);

    static int clampWorkerCount(int requested);

private:
    TrackFetcherPtr m_fetcher;
    DownloadProgressCallback m_progressCallback;
    const int m_workerCount;

    BoundedQueue<DownloadJob> m_queue;
    std::vector<std::thread> m_workers;

    // Guarded by m_mutex
    std::unordered_map<std::string, DownloadJob> m_activeJobs;
    std::unordered_map<std::string, DownloadJob> m_failedJobs;
    bool m_running{false};
    bool m_paused{false};
    size_t m_outstanding{0};

    mutable std::mutex m_mutex;
    std::condition_variable m_pauseCondition;
    std::condition_variable m_idleCondition;

    // Serializes start() and joining stop() calls
    std::mutex m_lifecycleMutex;
};

} // namespace trackdl::core::downloader
