#pragma once

#include "Config.h"
#include "Constants.h"
#include "Result.h"

#include <string>

namespace RelayPipe {

/**
 * @brief Client settings: relay url, channel, password and timeouts
 *
 * Read from ~/.config/relaypipe/relaypipe.conf (or RELAYPIPE_CONFIG_FILE);
 * RELAYPIPE_PASSWORD overrides the stored password.
 */
struct ClientConfig {
    std::string url = "http://127.0.0.1:" + std::to_string(config::DEFAULT_PORT);
    std::string channel;
    std::string password;
    int timeoutMs = config::DEFAULT_REQUEST_TIMEOUT_MS;
    int idleTimeoutMs = config::DEFAULT_IDLE_TIMEOUT_MS;
    int pollWaitMs = config::DEFAULT_POLL_WAIT_MS;
    int maxRetries = config::DEFAULT_MAX_RETRIES;
    int ttlSec = 0;
    bool compress = false;

    bool encrypted() const { return !password.empty(); }

    /**
     * @brief Load the config file if present, then apply the environment
     * @param path empty for the default location
     */
    static Result<ClientConfig> load(const std::string& path = "");

    static ClientConfig fromConfig(const Config& cfg);
    void toConfig(Config& cfg) const;

    /**
     * @brief Write url, channel, password and options back to a file
     */
    VoidResult save(const std::string& path) const;

    VoidResult validate() const;
};

} // namespace RelayPipe
