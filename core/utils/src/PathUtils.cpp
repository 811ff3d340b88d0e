#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace RelayPipe {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "relaypipe";
    }
    return getHome() / ".config" / "relaypipe";
}

std::filesystem::path PathUtils::getDataDir() {
    if (const char* data = std::getenv("XDG_DATA_HOME")) {
        return std::filesystem::path(data) / "relaypipe";
    }
    return getHome() / ".local" / "share" / "relaypipe";
}

std::filesystem::path PathUtils::getClientConfigPath() {
    if (const char* file = std::getenv("RELAYPIPE_CONFIG_FILE")) {
        if (*file != '\0') {
            return std::filesystem::path(file);
        }
    }
    return getConfigDir() / "relaypipe.conf";
}

std::filesystem::path PathUtils::getServerConfigPath() {
    return getConfigDir() / "relaypipe_server.conf";
}

std::filesystem::path PathUtils::getStateFilePath() {
    return getDataDir() / "relaypipe_state.db";
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

} // namespace RelayPipe
