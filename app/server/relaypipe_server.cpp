#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include "ChannelStore.h"
#include "Config.h"
#include "Constants.h"
#include "ExpirySweeper.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathUtils.h"
#include "RelayHttpServer.h"
#include "RelayProtocolHandler.h"
#include "StateFile.h"
#include "Version.h"

using namespace RelayPipe;

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    void printUsage(const char* prog) {
        std::cout << "RelayPipe Server - store-and-forward relay" << std::endl;
        std::cout << "\nUsage: " << prog << " [OPTIONS]" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <PATH>         key=value config file" << std::endl;
        std::cout << "  --host <ADDR>           Listen address (default: 0.0.0.0)" << std::endl;
        std::cout << "  --port <PORT>           Listen port (default: " << config::DEFAULT_PORT << ", 0 = any)" << std::endl;
        std::cout << "  --workers <N>           Request worker threads (default: 32)" << std::endl;
        std::cout << "  --state-file <PATH>     Save channels here on shutdown and reload them on start" << std::endl;
        std::cout << "                          ('default' = " << "$XDG_DATA_HOME/relaypipe/relaypipe_state.db)" << std::endl;
        std::cout << "  --log-level <LEVEL>     debug, info, warn, error or critical" << std::endl;
        std::cout << "  --log-file <PATH>       Also log to this file" << std::endl;
        std::cout << "  --version               Print the version and exit" << std::endl;
        std::cout << "  --help                  Show this help message" << std::endl;
    }

    std::unordered_map<std::string, Config::Validator> configSchema() {
        return {
            {"port", Config::intInRange(0, 65535)},
            {"worker_threads", Config::intInRange(1, 1024)},
            {"max_queued_connections", Config::intInRange(0, 1000000)},
            {"default_ttl_sec", Config::intInRange(1, config::MAX_TTL_SEC)},
            {"max_ttl_sec", Config::intInRange(1, 7 * 24 * 60 * 60)},
            {"lock_idle_timeout_ms", Config::intInRange(100, 24 * 60 * 60 * 1000)},
            {"max_wait_ms", Config::intInRange(0, 5 * 60 * 1000)},
            {"max_channel_bytes", Config::intInRange(static_cast<long long>(config::MAX_FRAME_SIZE),
                                                     16LL * 1024 * 1024 * 1024)},
            {"sweep_interval_ms", Config::intInRange(10, 60 * 60 * 1000)},
            {"rate_limit_rps", Config::intInRange(0, 1000000)},
            {"rate_limit_burst", Config::intInRange(0, 1000000)},
            {"log_level", Config::oneOf({"debug", "info", "warn", "warning", "error", "critical"})},
        };
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Server");

    std::string configPath;
    std::unordered_map<std::string, std::string> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--host" && i + 1 < argc) {
            overrides["host"] = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            overrides["port"] = argv[++i];
        }
        else if (arg == "--workers" && i + 1 < argc) {
            overrides["worker_threads"] = argv[++i];
        }
        else if (arg == "--state-file" && i + 1 < argc) {
            overrides["state_file"] = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            overrides["log_level"] = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            overrides["log_file"] = argv[++i];
        }
        else if (arg == "--version") {
            std::cout << "relaypipe_server " << Version::toString() << std::endl;
            return 0;
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // --- Configuration ---
    auto& cfg = Config::instance();
    if (configPath.empty()) {
        try {
            auto fallback = PathUtils::getServerConfigPath();
            if (std::filesystem::exists(fallback)) {
                configPath = fallback.string();
            }
        } catch (const std::exception& e) {
            logger.debug(std::string("No default server config: ") + e.what());
        }
    }
    if (!configPath.empty() && !cfg.loadFromFile(configPath)) {
        std::cerr << "Error: Cannot read config file " << configPath << std::endl;
        return 1;
    }
    for (const auto& [key, value] : overrides) {
        cfg.set(key, value);
    }

    std::string failedKey;
    if (!cfg.validate(configSchema(), &failedKey)) {
        std::cerr << "Error: Invalid value for '" << failedKey << "': " << cfg.get(failedKey) << std::endl;
        return 1;
    }

    logger.setLevel(Logger::parseLevel(cfg.get("log_level", "info")));
    std::string logFile = cfg.get("log_file");
    if (!logFile.empty()) {
        try {
            auto parent = std::filesystem::path(logFile).parent_path();
            if (!parent.empty()) {
                PathUtils::ensureDirectory(parent);
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
        logger.setLogFile(logFile);
        logger.setMaxFileSize(config::MAX_LOG_FILE_SIZE_MB);
    }

    logger.info("=== RelayPipe Server " + Version::toString() + " Starting ===");

    ChannelStoreOptions storeOptions;
    storeOptions.maxChannelBytes = cfg.getSize("max_channel_bytes", config::MAX_CHANNEL_BYTES);
    storeOptions.lockIdleTimeout = std::chrono::milliseconds(cfg.getInt("lock_idle_timeout_ms", config::LOCK_IDLE_TIMEOUT_MS));
    storeOptions.defaultTtl = std::chrono::seconds(cfg.getInt("default_ttl_sec", config::DEFAULT_TTL_SEC));
    storeOptions.maxTtl = std::chrono::seconds(cfg.getInt("max_ttl_sec", config::MAX_TTL_SEC));

    ChannelStore store(storeOptions);

    // --- Saved state ---
    std::unique_ptr<StateFile> stateFile;
    std::string statePath = cfg.get("state_file");
    if (statePath == "default") {
        try {
            statePath = PathUtils::getStateFilePath().string();
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    if (!statePath.empty()) {
        stateFile = std::make_unique<StateFile>(statePath);
        auto saved = stateFile->load();
        if (!saved) {
            logger.error("Ignoring unreadable state file: " + saved.error().toString());
        } else if (!saved->empty()) {
            auto restored = store.restore(*saved);
            logger.info("Restored " + std::to_string(restored) + " channel(s) from " + statePath);
            auto cleared = stateFile->clear();
            if (!cleared) {
                logger.warn("Could not clear state file after loading: " + cleared.error().toString());
            }
        }
    }

    // --- Handler, sweeper, server ---
    RelayHandlerOptions handlerOptions;
    handlerOptions.maxWaitMs = cfg.getInt("max_wait_ms", config::MAX_WAIT_MS);
    handlerOptions.rateLimitRps = cfg.getSize("rate_limit_rps", config::DEFAULT_RATE_LIMIT_RPS);
    handlerOptions.rateLimitBurst = cfg.getSize("rate_limit_burst", 0);
    RelayProtocolHandler handler(store, handlerOptions);

    ExpirySweeper sweeper(store,
                          std::chrono::milliseconds(cfg.getInt("sweep_interval_ms", config::SWEEP_INTERVAL_MS)),
                          storeOptions.defaultTtl);

    handler.setHealthCollector([&sweeper, &stateFile]() {
        std::vector<HealthCheck> checks;
        checks.emplace_back("expiry_sweeper",
                            sweeper.isRunning() ? HealthStatus::Healthy : HealthStatus::Unhealthy,
                            std::to_string(sweeper.totalEvicted()) + " evicted");
        if (stateFile) {
            checks.emplace_back("state_file", HealthStatus::Healthy, stateFile->path());
        }
        return checks;
    });

    RelayServerOptions serverOptions;
    serverOptions.host = cfg.get("host", serverOptions.host);
    serverOptions.port = cfg.getInt("port", config::DEFAULT_PORT);
    serverOptions.workerThreads = cfg.getSize("worker_threads", serverOptions.workerThreads);
    serverOptions.maxQueuedConnections = cfg.getSize("max_queued_connections", serverOptions.maxQueuedConnections);
    RelayHttpServer server(handler, serverOptions);

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    sweeper.start();
    if (!server.start()) {
        std::cerr << "Failed to start relay on " << serverOptions.host << ":" << serverOptions.port << std::endl;
        sweeper.stop();
        return 1;
    }
    handler.setReady(true);

    logger.info("Relay running. Press Ctrl+C to stop.");

    auto lastPrune = std::chrono::steady_clock::now();
    while (!signalReceived) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        if (now - lastPrune > std::chrono::minutes(1)) {
            handler.rateLimiter().pruneIdle(std::chrono::minutes(5), now);
            lastPrune = now;
        }
    }

    logger.info("Received signal " + std::to_string(static_cast<int>(receivedSignalNum)) + ", initiating shutdown");

    // --- Shutdown ---
    handler.beginShutdown();
    server.stop();
    sweeper.stop();

    if (stateFile) {
        auto saved = stateFile->save(store.snapshotAll());
        if (!saved) {
            logger.error("Failed to save channel state: " + saved.error().toString());
        }
    }

    logger.info(MetricsCollector::instance().getMetricsSummary());
    logger.info("=== RelayPipe Server Stopped ===");
    return 0;
}
