/**
 * DownloadEvent.cpp
 *
 * State names and JSON conversions.
 */

#include "DownloadEvent.hpp"

namespace trackdl::core::downloader {

const char* toString(DownloadState state) {
    switch (state) {
        case DownloadState::Queued:      return "queued";
        case DownloadState::Downloading: return "downloading";
        case DownloadState::Completed:   return "completed";
        case DownloadState::Error:       return "error";
        case DownloadState::Cancelled:   return "cancelled";
    }
    return "unknown";
}

std::optional<DownloadState> parseDownloadState(const std::string& name) {
    if (name == "queued") return DownloadState::Queued;
    if (name == "downloading") return DownloadState::Downloading;
    if (name == "completed") return DownloadState::Completed;
    if (name == "error") return DownloadState::Error;
    if (name == "cancelled") return DownloadState::Cancelled;
    return std::nullopt;
}

bool isTerminal(DownloadState state) {
    return state == DownloadState::Completed ||
           state == DownloadState::Error ||
           state == DownloadState::Cancelled;
}

void to_json(nlohmann::json& j, const DownloadResult& result) {
    j = nlohmann::json{
        {"trackId", result.trackId},
        {"filePath", result.filePath},
        {"fileSize", result.fileSize},
        {"success", result.success}
    };
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
}

void from_json(const nlohmann::json& j, DownloadResult& result) {
    result.trackId = j.value("trackId", std::string{});
    result.filePath = j.value("filePath", std::string{});
    result.fileSize = j.value("fileSize", uint64_t{0});
    result.success = j.value("success", false);
    result.error = j.value("error", std::string{});
}

void to_json(nlohmann::json& j, const DownloadEvent& event) {
    j = nlohmann::json{
        {"trackId", event.trackId},
        {"status", toString(event.state)}
    };
    if (event.result) {
        j["result"] = *event.result;
    } else {
        j["result"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const QueueStatus& status) {
    j = nlohmann::json{
        {"running", status.running},
        {"paused", status.paused},
        {"activeCount", status.activeCount},
        {"queueLength", status.queueLength},
        {"failedCount", status.failedCount}
    };
}

} // namespace trackdl::core::downloader
