/**
 * HttpTrackFetcher.cpp
 */

#include "HttpTrackFetcher.hpp"
#include "../Logger.hpp"
#include "../Config.hpp"
#include "../../utils/StringUtils.hpp"

#include <system_error>

namespace trackdl::core::downloader {

HttpTrackFetcherOptions HttpTrackFetcherOptions::fromConfig() {
    auto& config = Config::instance();

    HttpTrackFetcherOptions options;
    options.streamUrlTemplate = config.get<std::string>("downloads.streamUrlTemplate", "");
    options.fileExtension = config.get<std::string>("downloads.fileExtension", "flac");
    options.http.timeoutSeconds = config.get<int>("downloads.timeout", 60);
    options.http.connectTimeoutSeconds = config.get<int>("downloads.connectTimeout", 10);
    return options;
}

HttpTrackFetcher::HttpTrackFetcher(HttpTrackFetcherOptions options)
    : m_options(std::move(options))
    , m_client(m_options.http) {
    m_options.fileExtension = utils::StringUtils::trim(m_options.fileExtension);
    if (!m_options.fileExtension.empty() && m_options.fileExtension.front() == '.') {
        m_options.fileExtension.erase(0, 1);
    }
}

std::string HttpTrackFetcher::buildStreamUrl(const std::string& trackId) const {
    if (m_options.streamUrlTemplate.empty()) {
        return {};
    }
    return utils::StringUtils::replaceAll(
        m_options.streamUrlTemplate, "{id}", utils::HttpClient::urlEncode(trackId));
}

std::filesystem::path HttpTrackFetcher::buildDestination(
    const std::string& trackId, const std::string& outputDir) const {
    std::string name = utils::StringUtils::sanitizeFileName(trackId);
    if (!m_options.fileExtension.empty()) {
        name += "." + m_options.fileExtension;
    }
    return std::filesystem::path(outputDir) / name;
}

DownloadResult HttpTrackFetcher::fetch(const std::string& trackId, const std::string& outputDir) {
    std::string url = buildStreamUrl(trackId);
    if (url.empty()) {
        return DownloadResult::failed(trackId, "stream URL template not configured");
    }
    if (outputDir.empty()) {
        return DownloadResult::failed(trackId, "no output directory specified");
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        return DownloadResult::failed(trackId, "cannot create " + outputDir + ": " + ec.message());
    }

    auto destination = buildDestination(trackId, outputDir);

    Logger::instance().debug("Fetching {} -> {}", url, destination.string());
    utils::HttpResponse response = m_client.downloadFile(url, destination.string());

    if (!response.isSuccess()) {
        return DownloadResult::failed(trackId, response.describeFailure());
    }

    auto size = std::filesystem::file_size(destination, ec);
    if (ec) {
        return DownloadResult::failed(trackId, "downloaded file missing: " + ec.message());
    }

    return DownloadResult::succeeded(trackId, destination.string(), static_cast<uint64_t>(size));
}

} // namespace trackdl::core::downloader
