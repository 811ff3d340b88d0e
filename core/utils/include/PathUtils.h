#pragma once

#include <filesystem>
#include <string>

namespace RelayPipe {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDataDir();

    /// $RELAYPIPE_CONFIG_FILE, or relaypipe.conf in the config dir
    static std::filesystem::path getClientConfigPath();
    static std::filesystem::path getServerConfigPath();
    static std::filesystem::path getStateFilePath();

    static void ensureDirectory(const std::filesystem::path& dir);
};

} // namespace RelayPipe
