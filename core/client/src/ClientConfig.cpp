#include "ClientConfig.h"
#include "ChannelStore.h"
#include "HttpClient.h"
#include "Logger.h"
#include "PathUtils.h"

#include <cstdlib>
#include <filesystem>
#include <sys/stat.h>

namespace RelayPipe {

ClientConfig ClientConfig::fromConfig(const Config& cfg) {
    ClientConfig out;
    out.url = cfg.get("url", out.url);
    out.channel = cfg.get("channel", out.channel);
    out.password = cfg.get("password", out.password);
    out.timeoutMs = cfg.getInt("timeout_ms", out.timeoutMs);
    out.idleTimeoutMs = cfg.getInt("idle_timeout_ms", out.idleTimeoutMs);
    out.pollWaitMs = cfg.getInt("poll_wait_ms", out.pollWaitMs);
    out.maxRetries = cfg.getInt("max_retries", out.maxRetries);
    out.ttlSec = cfg.getInt("ttl_sec", out.ttlSec);
    out.compress = cfg.getBool("compress", out.compress);
    return out;
}

void ClientConfig::toConfig(Config& cfg) const {
    cfg.set("url", url);
    cfg.set("channel", channel);
    if (!password.empty()) {
        cfg.set("password", password);
    }
    cfg.setInt("timeout_ms", timeoutMs);
    cfg.setInt("idle_timeout_ms", idleTimeoutMs);
    cfg.setInt("poll_wait_ms", pollWaitMs);
    cfg.setInt("max_retries", maxRetries);
    cfg.setInt("ttl_sec", ttlSec);
    cfg.setBool("compress", compress);
}

Result<ClientConfig> ClientConfig::load(const std::string& path) {
    std::string file = path;
    if (file.empty()) {
        try {
            file = PathUtils::getClientConfigPath().string();
        } catch (const std::exception& e) {
            Logger::instance().debug(std::string("No default config location: ") + e.what(), "ClientConfig");
        }
    }

    Config cfg;
    std::error_code ec;
    if (!file.empty() && std::filesystem::exists(file, ec)) {
        if (!cfg.loadFromFile(file)) {
            return Err(ErrorCode::ConfigError, "cannot read config file " + file);
        }
        Logger::instance().debug("Loaded client config from " + file, "ClientConfig");
    } else if (!path.empty()) {
        return Err(ErrorCode::ConfigError, "config file " + path + " does not exist");
    }

    ClientConfig out = fromConfig(cfg);
    if (const char* envPassword = std::getenv("RELAYPIPE_PASSWORD")) {
        out.password = envPassword;
    }
    return out;
}

VoidResult ClientConfig::save(const std::string& path) const {
    std::string file = path;
    if (file.empty()) {
        try {
            file = PathUtils::getClientConfigPath().string();
            PathUtils::ensureDirectory(std::filesystem::path(file).parent_path());
        } catch (const std::exception& e) {
            return Err(ErrorCode::ConfigError, e.what());
        }
    }

    Config cfg;
    toConfig(cfg);
    if (!cfg.saveToFile(file)) {
        return Err(ErrorCode::ConfigError, "cannot write config file " + file);
    }
    // The file may hold the channel password
    if (chmod(file.c_str(), S_IRUSR | S_IWUSR) != 0) {
        Logger::instance().warn("Could not restrict permissions of " + file, "ClientConfig");
    }
    return Ok();
}

VoidResult ClientConfig::validate() const {
    auto parsed = RelayUrl::parse(url);
    if (!parsed) {
        return parsed.error();
    }
    if (!ChannelStore::isValidChannelName(channel)) {
        return Err(ErrorCode::ConfigError, channel.empty() ? "no channel given"
                                                           : "invalid channel name: " + channel);
    }
    if (timeoutMs <= 0 || idleTimeoutMs <= 0) {
        return Err(ErrorCode::ConfigError, "timeouts must be positive");
    }
    if (pollWaitMs < 0 || pollWaitMs > config::MAX_WAIT_MS) {
        return Err(ErrorCode::ConfigError, "poll_wait_ms must be between 0 and " + std::to_string(config::MAX_WAIT_MS));
    }
    if (pollWaitMs >= timeoutMs) {
        return Err(ErrorCode::ConfigError, "poll_wait_ms must be shorter than timeout_ms");
    }
    if (maxRetries < 1) {
        return Err(ErrorCode::ConfigError, "max_retries must be at least 1");
    }
    if (ttlSec < 0 || ttlSec > config::MAX_TTL_SEC) {
        return Err(ErrorCode::ConfigError, "ttl_sec out of range");
    }
    return Ok();
}

} // namespace RelayPipe
