/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "downloader/HttpTrackFetcher.hpp"

#include <stdexcept>

namespace trackdl::core {

using namespace downloader;

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    shutdown();
}

bool Application::initialize(TrackFetcherPtr fetcher) {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    try {
        if (!fetcher) {
            auto options = HttpTrackFetcherOptions::fromConfig();
            if (options.streamUrlTemplate.empty()) {
                Logger::instance().warn("downloads.streamUrlTemplate is empty; downloads will fail until it is set");
            }
            fetcher = std::make_shared<HttpTrackFetcher>(std::move(options));
        }

        m_downloadManager = std::make_unique<DownloadManager>(
            std::move(fetcher),
            DownloadManagerOptions::fromConfig(),
            [this](const std::string& trackId, DownloadState state,
                   const std::optional<DownloadResult>& result) {
                onDownloadProgress(trackId, state, result);
            }
        );
        m_downloadManager->start();

    } catch (const std::exception& e) {
        Logger::instance().error("Failed to initialize downloader: {}", e.what());
        m_downloadManager.reset();
        setState(AppState::Error);
        return false;
    }

    setState(AppState::Ready);
    Logger::instance().info("Download manager started ({} workers)", m_downloadManager->getWorkerCount());
    return true;
}

void Application::shutdown() {
    auto state = m_state.load();
    if (state == AppState::ShuttingDown || state == AppState::Uninitialized) {
        return;
    }

    if (m_downloadManager && m_downloadManager->isWorkerThread()) {
        // Called from a subscriber on a download worker: stop intake now,
        // join and tear down on the next shutdown() from another thread
        Logger::instance().info("Shutdown requested from a download worker");
        m_downloadManager->stop();
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    if (m_downloadManager) {
        m_downloadManager->stop();
        m_downloadManager.reset();
    }

    m_eventBus.clear();
    Logger::instance().info("Application shutdown complete");

    setState(AppState::Uninitialized);
}

DownloadManager& Application::getDownloadManager() {
    if (!m_downloadManager) {
        throw std::logic_error("download manager not initialized");
    }
    return *m_downloadManager;
}

void Application::onDownloadProgress(
    const std::string& trackId,
    DownloadState state,
    const std::optional<DownloadResult>& result
) {
    switch (state) {
        case DownloadState::Queued:
            Logger::instance().debug("Track {} added to queue", trackId);
            break;
        case DownloadState::Downloading:
            Logger::instance().debug("Downloading track {}...", trackId);
            break;
        case DownloadState::Completed:
            Logger::instance().debug("Track {} completed", trackId);
            break;
        case DownloadState::Error:
            Logger::instance().debug("Track {} failed: {}", trackId, result ? result->error : "");
            break;
        case DownloadState::Cancelled:
            Logger::instance().debug("Track {} cancelled", trackId);
            break;
    }

    m_eventBus.emit(kDownloadProgressEvent, json(DownloadEvent{trackId, state, result}));
}

} // namespace trackdl::core
