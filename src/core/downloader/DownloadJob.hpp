#pragma once

/**
 * DownloadJob.hpp
 *
 * A single track download request and its cancellation token.
 */

#include <atomic>
#include <memory>
#include <string>

namespace trackdl::core::downloader {

/**
 * CancellationToken - shared, idempotent cancel signal for one job
 *
 * Copies share the same flag, so the caller that built a job can keep a
 * token and signal it while the job sits in the queue or runs on a worker.
 */
class CancellationToken {
public:
    CancellationToken()
        : m_signaled(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * Request cancellation. Safe to call any number of times, before or
     * after the job has finished.
     */
    void signal() const {
        m_signaled->store(true, std::memory_order_release);
    }

    bool isSignaled() const {
        return m_signaled->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_signaled;
};

/**
 * DownloadJob - one queued track download
 */
struct DownloadJob {
    // Track identifier understood by the fetcher
    std::string id;

    // Directory the fetcher writes into
    std::string outputDir;

    // Display only
    std::string title;
    std::string artist;

    // Created with the job; shared by every copy of it
    CancellationToken cancellation;

    DownloadJob() = default;

    DownloadJob(std::string id_, std::string outputDir_,
                std::string title_ = {}, std::string artist_ = {})
        : id(std::move(id_))
        , outputDir(std::move(outputDir_))
        , title(std::move(title_))
        , artist(std::move(artist_)) {}

    /**
     * Copy of this job with a new, unsignaled token. Used when a failed
     * job is queued again.
     */
    DownloadJob withFreshToken() const {
        return DownloadJob(id, outputDir, title, artist);
    }

    /**
     * "Artist - Title" when known, otherwise the id
     */
    std::string displayName() const {
        if (!artist.empty() && !title.empty()) {
            return artist + " - " + title;
        }
        if (!title.empty()) {
            return title;
        }
        return id;
    }
};

} // namespace trackdl::core::downloader
