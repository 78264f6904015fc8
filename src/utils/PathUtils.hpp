#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace trackdl::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getHomePath() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? fs::path(home) : fs::current_path();
    }

    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        return getHomePath() / "Library" / "Application Support";
#else
        return getHomePath() / ".local" / "share";
#endif
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "TrackDL";
    }

    static fs::path getConfigPath() {
        return getDataPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getDataPath() / "logs";
    }

    // Default download root
    static fs::path getMusicPath() {
        return getHomePath() / "Music";
    }
};

} // namespace trackdl::utils
