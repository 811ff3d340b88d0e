#pragma once

/**
 * @file RelayHttpServer.h
 * @brief Accept loop for the relay's HTTP/1.1 endpoint
 *
 * One listener thread accepts connections and hands each one to a worker
 * pool. Every connection carries exactly one request. When every worker is
 * busy and the backlog is full the listener answers 429 itself.
 */

#include "Constants.h"
#include "SocketGuard.h"
#include "ThreadPool.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace RelayPipe {

class RelayProtocolHandler;

struct RelayServerOptions {
    std::string host = "0.0.0.0";
    int port = config::DEFAULT_PORT;          // 0 picks an ephemeral port
    size_t workerThreads = 32;                // long-polls occupy a worker each
    size_t maxQueuedConnections = 256;        // accepted but waiting for a worker; 0 = unbounded
    int ioTimeoutMs = config::SERVER_IO_TIMEOUT_MS;
    size_t maxBodyBytes = config::MAX_FRAME_SIZE;
};

/**
 * Usage:
 * @code
 * ChannelStore store;
 * RelayProtocolHandler handler(store);
 * RelayHttpServer server(handler, options);
 * if (!server.start()) return 1;
 * ...
 * handler.beginShutdown();
 * server.stop();
 * @endcode
 */
class RelayHttpServer {
public:
    RelayHttpServer(RelayProtocolHandler& handler, RelayServerOptions options = RelayServerOptions());
    ~RelayHttpServer();

    RelayHttpServer(const RelayHttpServer&) = delete;
    RelayHttpServer& operator=(const RelayHttpServer&) = delete;

    /**
     * @brief Bind, listen and start accepting
     * @return false if the address could not be bound
     */
    bool start();

    /**
     * @brief Stop accepting and wait for in-flight requests
     */
    void stop();

    bool isRunning() const { return running_; }

    /// Bound port, resolved after start() when 0 was requested
    int port() const { return port_; }

    size_t activeConnections() const { return activeConnections_; }

    /// Connections turned away because the worker backlog was full
    size_t rejectedConnections() const { return workers_ ? workers_->rejected() : 0; }

private:
    void serverLoop();
    void handleClient(SocketGuard client, const std::string& remoteAddress);
    void rejectClient(SocketGuard& client, const std::string& remoteAddress, const Error& reason);

    RelayProtocolHandler& handler_;
    RelayServerOptions options_;
    int port_;

    SocketGuard listenSocket_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> activeConnections_{0};
    std::thread serverThread_;
    std::unique_ptr<ThreadPool> workers_;
};

} // namespace RelayPipe
