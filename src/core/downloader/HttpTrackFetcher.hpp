#pragma once

/**
 * HttpTrackFetcher.hpp
 *
 * TrackFetcher that downloads a track from a stream URL built from a
 * template such as "https://media.example.com/tracks/{id}/stream".
 */

#include "TrackFetcher.hpp"
#include "../../utils/HttpClient.hpp"

#include <filesystem>
#include <string>

namespace trackdl::core::downloader {

struct HttpTrackFetcherOptions {
    // "{id}" is replaced with the URL-encoded track id
    std::string streamUrlTemplate;

    std::string fileExtension{"flac"};

    utils::HttpOptions http;

    /**
     * Read the downloads.* keys from Config::instance()
     */
    static HttpTrackFetcherOptions fromConfig();
};

class HttpTrackFetcher final : public TrackFetcher {
public:
    explicit HttpTrackFetcher(HttpTrackFetcherOptions options);

    DownloadResult fetch(const std::string& trackId, const std::string& outputDir) override;

    /**
     * @return Empty if no template is configured
     */
    std::string buildStreamUrl(const std::string& trackId) const;

    /**
     * <outputDir>/<sanitized id>.<extension>
     */
    std::filesystem::path buildDestination(const std::string& trackId, const std::string& outputDir) const;

private:
    HttpTrackFetcherOptions m_options;
    utils::HttpClient m_client;
};

} // namespace trackdl::core::downloader
