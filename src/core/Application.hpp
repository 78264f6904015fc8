#pragma once

/**
 * Application.hpp
 *
 * Application root: owns the download manager and the event bus and
 * wires them together.
 */

#include "EventBus.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/TrackFetcher.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace trackdl::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Event published on the bus for every download state transition.
 * Payload: {"trackId", "status", "result"}.
 */
inline constexpr const char* kDownloadProgressEvent = "download.progress";

/**
 * Main application class
 *
 * Subsystems are created in initialize() and destroyed in shutdown().
 * Other components receive the DownloadManager by reference.
 */
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Build the fetcher and download manager from Config and start the
     * worker pool.
     * @param fetcher Overrides the HTTP fetcher built from config
     * @return false if already initialized or a subsystem failed
     */
    bool initialize(downloader::TrackFetcherPtr fetcher = nullptr);

    /**
     * Stop the download manager (joins workers) and drop subscribers.
     * From a download worker (a bus subscriber) only the stop is
     * requested; the teardown happens on the next call or in the destructor.
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    bool isRunning() const { return m_state.load() == AppState::Ready; }

    /**
     * @throws std::logic_error before initialize()
     */
    downloader::DownloadManager& getDownloadManager();

    EventBus& getEventBus() { return m_eventBus; }

private:
    void onDownloadProgress(const std::string& trackId,
                            downloader::DownloadState state,
                            const std::optional<downloader::DownloadResult>& result);

    void setState(AppState state) { m_state = state; }

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    EventBus m_eventBus;
    std::unique_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace trackdl::core
