/**
 * DownloadManager.cpp
 *
 * Implementation of the concurrent track download queue.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../Config.hpp"

#include <stdexcept>

namespace trackdl::core::downloader {

namespace {

// Manager whose worker pool the current thread belongs to
thread_local const DownloadManager* t_workerOwner = nullptr;

} // namespace

DownloadManagerOptions DownloadManagerOptions::fromConfig() {
    auto& config = Config::instance();

    DownloadManagerOptions options;
    options.workerCount = config.get<int>("downloads.concurrentDownloads", DownloadManager::kDefaultWorkers);

    int capacity = config.get<int>("downloads.queueCapacity", 1000);
    options.queueCapacity = capacity > 0 ? static_cast<size_t>(capacity) : 1000;
    return options;
}

DownloadManager::DownloadManager(
    TrackFetcherPtr fetcher,
    DownloadManagerOptions options,
    DownloadProgressCallback progressCallback
)
    : m_fetcher(std::move(fetcher))
    , m_progressCallback(std::move(progressCallback))
    , m_workerCount(clampWorkerCount(options.workerCount))
    , m_queue(options.queueCapacity) {
    if (!m_fetcher) {
        throw std::invalid_argument("DownloadManager requires a track fetcher");
    }
}

DownloadManager::~DownloadManager() {
    stop();
}

int DownloadManager::clampWorkerCount(int requested) {
    if (requested <= 0) {
        return kDefaultWorkers;
    }
    if (requested > kMaxWorkers) {
        Logger::instance().warn("Requested {} download workers, limiting to {}", requested, kMaxWorkers);
        return kMaxWorkers;
    }
    return requested;
}

void DownloadManager::start() {
    if (isWorkerThread()) {
        throw std::logic_error("DownloadManager::start() called from a download worker");
    }

    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            return;
        }
    }

    // Workers of a pool stopped from inside a progress callback
    joinWorkers();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = true;
        m_paused = false;
    }

    m_queue.reopen();

    m_workers.reserve(static_cast<size_t>(m_workerCount));
    for (int i = 0; i < m_workerCount; ++i) {
        m_workers.emplace_back([this, i] {
            workerLoop(i);
        });
    }

    Logger::instance().info("DownloadManager started ({} workers, queue capacity {})",
                            m_workerCount, m_queue.capacity());
}

void DownloadManager::stop() {
    if (isWorkerThread()) {
        // A worker cannot join itself
        requestStop();
        return;
    }

    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    requestStop();
    joinWorkers();
}

void DownloadManager::requestStop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        m_paused = false;
    }
    m_pauseCondition.notify_all();

    Logger::instance().info("Stopping DownloadManager, waiting for active downloads");

    m_queue.close();

    size_t dropped = m_queue.clear();
    if (dropped > 0) {
        Logger::instance().info("Dropped {} queued downloads", dropped);
        finishJob(dropped);
    }
}

void DownloadManager::joinWorkers() {
    if (m_workers.empty()) {
        return;
    }

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    Logger::instance().info("DownloadManager stopped");
}

bool DownloadManager::isWorkerThread() const {
    return t_workerOwner == this;
}

void DownloadManager::enqueue(const DownloadJob& job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            throw NotRunningError();
        }
        ++m_outstanding;
    }

    // Reported before the push so no worker can emit `downloading` first
    notify(job.id, DownloadState::Queued);

    if (!m_queue.push(job)) {
        Logger::instance().debug("Track {} dropped, manager stopped while queueing", job.id);
        finishJob();
        throw NotRunningError();
    }

    Logger::instance().debug("Queued track {} ({}) -> {}", job.id, job.displayName(), job.outputDir);
}

size_t DownloadManager::enqueueMany(const std::vector<DownloadJob>& jobs) {
    size_t queued = 0;

    for (const auto& job : jobs) {
        try {
            enqueue(job);
            ++queued;
        } catch (const DownloadError& e) {
            Logger::instance().warn("Could not queue track {}: {}", job.id, e.what());
        }
    }

    return queued;
}

void DownloadManager::cancelDownload(const std::string& trackId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_activeJobs.find(trackId);
    if (it == m_activeJobs.end()) {
        throw JobNotActiveError(trackId);
    }

    it->second.cancellation.signal();
    Logger::instance().info("Cancellation requested for track {}", trackId);
}

bool DownloadManager::pauseQueue() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_paused) {
        return false;
    }
    m_paused = true;
    Logger::instance().info("Download queue paused");
    return true;
}

bool DownloadManager::resumeQueue() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_paused) {
            return false;
        }
        m_paused = false;
    }
    m_pauseCondition.notify_all();
    Logger::instance().info("Download queue resumed");
    return true;
}

size_t DownloadManager::retryAllFailed() {
    std::vector<DownloadJob> jobsToRetry;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        jobsToRetry.reserve(m_failedJobs.size());
        for (const auto& [id, job] : m_failedJobs) {
            jobsToRetry.push_back(job.withFreshToken());
        }
        m_failedJobs.clear();
    }

    size_t retried = 0;
    for (const auto& job : jobsToRetry) {
        try {
            enqueue(job);
            ++retried;
        } catch (const DownloadError& e) {
            Logger::instance().warn("Dropping failed track {} from retry: {}", job.id, e.what());
        }
    }

    Logger::instance().info("Retrying {} of {} failed downloads", retried, jobsToRetry.size());
    return retried;
}

size_t DownloadManager::clearFailed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = m_failedJobs.size();
    m_failedJobs.clear();
    return count;
}

size_t DownloadManager::getActiveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activeJobs.size();
}

size_t DownloadManager::getQueueLength() const {
    return m_queue.size();
}

size_t DownloadManager::getFailedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failedJobs.size();
}

bool DownloadManager::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

bool DownloadManager::isPaused() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_paused;
}

QueueStatus DownloadManager::getStatus() const {
    QueueStatus status;
    status.queueLength = m_queue.size();

    std::lock_guard<std::mutex> lock(m_mutex);
    status.running = m_running;
    status.paused = m_paused;
    status.activeCount = m_activeJobs.size();
    status.failedCount = m_failedJobs.size();
    return status;
}

std::vector<DownloadJob> DownloadManager::getFailedJobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<DownloadJob> jobs;
    jobs.reserve(m_failedJobs.size());
    for (const auto& [id, job] : m_failedJobs) {
        jobs.push_back(job);
    }
    return jobs;
}

void DownloadManager::waitForAll() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCondition.wait(lock, [this] {
        return m_outstanding == 0;
    });
}

bool DownloadManager::waitForAll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCondition.wait_for(lock, timeout, [this] {
        return m_outstanding == 0;
    });
}

void DownloadManager::workerLoop(int workerId) {
    t_workerOwner = this;
    Logger::instance().debug("Download worker {} started", workerId);

    while (true) {
        std::optional<DownloadJob> job = m_queue.pop();
        if (!job) {
            break;
        }

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_pauseCondition.wait(lock, [this] {
                return !m_paused || !m_running;
            });

            if (!m_running) {
                lock.unlock();
                Logger::instance().debug("Worker {} dropping track {} on shutdown", workerId, job->id);
                finishJob();
                break;
            }
        }

        processDownload(*job, workerId);
        finishJob();
    }

    Logger::instance().debug("Download worker {} exiting", workerId);
}

void DownloadManager::processDownload(const DownloadJob& job, int workerId) {
    if (job.cancellation.isSignaled()) {
        Logger::instance().info("Track {} cancelled before download started", job.id);
        notify(job.id, DownloadState::Cancelled);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_activeJobs[job.id] = job;
    }

    notify(job.id, DownloadState::Downloading);
    Logger::instance().debug("Worker {} downloading track {} ({})", workerId, job.id, job.displayName());

    DownloadResult result = executeFetch(job);

    bool cancelled = job.cancellation.isSignaled();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_activeJobs.erase(job.id);

        if (!cancelled) {
            if (result.success) {
                m_failedJobs.erase(job.id);
            } else {
                m_failedJobs[job.id] = job;
            }
        }
    }

    if (cancelled) {
        Logger::instance().info("Track {} cancelled", job.id);
        notify(job.id, DownloadState::Cancelled);
    } else if (!result.success) {
        Logger::instance().warn("Download failed: {}", result.error);
        notify(job.id, DownloadState::Error, result);
    } else {
        Logger::instance().info("Downloaded: {} ({} bytes)", result.filePath, result.fileSize);
        notify(job.id, DownloadState::Completed, result);
    }
}

DownloadResult DownloadManager::executeFetch(const DownloadJob& job) {
    DownloadResult result;

    try {
        result = m_fetcher->fetch(job.id, job.outputDir);
    } catch (const std::exception& e) {
        result = DownloadResult::failed(job.id, e.what());
    }

    result.trackId = job.id;
    if (!result.success) {
        std::string reason = result.error.empty() ? "unknown error" : result.error;
        result.error = "track " + job.id + ": " + reason;
    }
    return result;
}

void DownloadManager::notify(
    const std::string& trackId,
    DownloadState state,
    const std::optional<DownloadResult>& result
) {
    if (!m_progressCallback) {
        return;
    }

    try {
        m_progressCallback(trackId, state, result);
    } catch (const std::exception& e) {
        Logger::instance().error("Progress callback failed for track {} ({}): {}",
                                 trackId, toString(state), e.what());
    } catch (...) {
        Logger::instance().error("Progress callback threw a non-standard exception for track {} ({})",
                                 trackId, toString(state));
    }
}

void DownloadManager::finishJob(size_t count) {
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_outstanding = count > m_outstanding ? 0 : m_outstanding - count;
        idle = m_outstanding == 0;
    }
    if (idle) {
        m_idleCondition.notify_all();
    }
}

} // namespace trackdl::core::downloader
