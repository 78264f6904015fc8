#pragma once

/**
 * DownloadEvent.hpp
 *
 * Lifecycle states, fetch results and the JSON shapes published to
 * listeners.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace trackdl::core::downloader {

/**
 * Job lifecycle state
 *
 * Queued -> Downloading -> {Completed | Error | Cancelled}
 * Queued -> Cancelled (token signaled before the fetch started)
 */
enum class DownloadState {
    Queued,
    Downloading,
    Completed,
    Error,
    Cancelled
};

/**
 * Wire name of a state ("queued", "downloading", ...)
 */
const char* toString(DownloadState state);

/**
 * Parse a wire name
 * @return nullopt for unknown names
 */
std::optional<DownloadState> parseDownloadState(const std::string& name);

/**
 * True for Completed, Error and Cancelled
 */
bool isTerminal(DownloadState state);

/**
 * Outcome of one fetch
 */
struct DownloadResult {
    std::string trackId;
    std::string filePath;
    uint64_t fileSize{0};
    bool success{false};
    std::string error;

    static DownloadResult succeeded(std::string trackId, std::string filePath, uint64_t fileSize) {
        DownloadResult result;
        result.trackId = std::move(trackId);
        result.filePath = std::move(filePath);
        result.fileSize = fileSize;
        result.success = true;
        return result;
    }

    static DownloadResult failed(std::string trackId, std::string error) {
        DownloadResult result;
        result.trackId = std::move(trackId);
        result.error = std::move(error);
        return result;
    }
};

/**
 * One state transition as seen by listeners
 */
struct DownloadEvent {
    std::string trackId;
    DownloadState state{DownloadState::Queued};
    std::optional<DownloadResult> result;
};

/**
 * Snapshot of the manager counters
 */
struct QueueStatus {
    bool running{false};
    bool paused{false};
    size_t activeCount{0};
    size_t queueLength{0};
    size_t failedCount{0};
};

void to_json(nlohmann::json& j, const DownloadResult& result);
void from_json(const nlohmann::json& j, DownloadResult& result);
void to_json(nlohmann::json& j, const DownloadEvent& event);
void to_json(nlohmann::json& j, const QueueStatus& status);

} // namespace trackdl::core::downloader
