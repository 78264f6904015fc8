#pragma once

/**
 * DownloadErrors.hpp
 *
 * Exceptions thrown by the DownloadManager surface.
 */

#include <stdexcept>
#include <string>

namespace trackdl::core::downloader {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Operation attempted while the manager is stopped
 */
class NotRunningError : public DownloadError {
public:
    NotRunningError()
        : DownloadError("download manager not running") {}
};

/**
 * Cancel target is not currently executing
 */
class JobNotActiveError : public DownloadError {
public:
    explicit JobNotActiveError(const std::string& jobId)
        : DownloadError("track " + jobId + " is not currently downloading")
        , m_jobId(jobId) {}

    const std::string& jobId() const { return m_jobId; }

private:
    std::string m_jobId;
};

} // namespace trackdl::core::downloader
