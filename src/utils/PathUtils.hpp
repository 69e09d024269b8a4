#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace tapedeck::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef __APPLE__
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* dataHome = std::getenv("XDG_DATA_HOME");
        if (dataHome && *dataHome) return fs::path(dataHome);
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getTapedeckPath() {
        return getAppDataPath() / "Tapedeck";
    }

    static fs::path getConfigPath() {
        return getTapedeckPath() / "config.json";
    }

    // Finished and partial audio files
    static fs::path getDownloadsPath() {
        return getTapedeckPath() / "downloads";
    }

    // Task store and process lock
    static fs::path getStatePath() {
        return getTapedeckPath() / "state";
    }

    static fs::path getManifestsPath() {
        return getTapedeckPath() / "manifests";
    }

    static fs::path getLogsPath() {
        return getTapedeckPath() / "logs";
    }
};

} // namespace tapedeck::utils
