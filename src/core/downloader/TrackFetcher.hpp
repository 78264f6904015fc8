#pragma once

/**
 * TrackFetcher.hpp
 *
 * Interface of the component that performs the actual transfer.
 */

#include "DownloadEvent.hpp"

#include <memory>
#include <string>

namespace trackdl::core::downloader {

/**
 * TrackFetcher - downloads one track into a directory
 *
 * Called from worker threads, possibly concurrently. The call blocks
 * until the transfer ends; any timeout must be enforced by the
 * implementation. Failures are reported through DownloadResult::success
 * and DownloadResult::error; a thrown std::exception is treated the same.
 */
class TrackFetcher {
public:
    virtual ~TrackFetcher() = default;

    virtual DownloadResult fetch(const std::string& trackId, const std::string& outputDir) = 0;
};

using TrackFetcherPtr = std::shared_ptr<TrackFetcher>;

} // namespace trackdl::core::downloader
