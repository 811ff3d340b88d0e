#include "RelayHttpServer.h"
#include "HttpMessage.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "RelayProtocolHandler.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace RelayPipe {

namespace {

const char* COMPONENT = "RelayServer";

std::string peerAddress(const struct sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

// Read and discard what the client is still sending so that closing the
// socket does not reset the connection before the error response is read
void drainInput(const SocketGuard& sock) {
    ::shutdown(sock.get(), SHUT_WR);
    sock.setTimeouts(1000);
    char buf[16384];
    size_t drained = 0;
    while (drained < config::MAX_FRAME_SIZE) {
        ssize_t n = recv(sock.get(), buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        drained += static_cast<size_t>(n);
    }
}

} // namespace

RelayHttpServer::RelayHttpServer(RelayProtocolHandler& handler, RelayServerOptions options)
    : handler_(handler)
    , options_(std::move(options))
    , port_(options_.port) {
}

RelayHttpServer::~RelayHttpServer() {
    stop();
}

bool RelayHttpServer::start() {
    auto& logger = Logger::instance();
    if (running_) {
        return true;
    }

    struct addrinfo hints{};
    struct addrinfo* resolved = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    std::string portStr = std::to_string(options_.port);
    const char* host = options_.host.empty() ? nullptr : options_.host.c_str();
    int status = getaddrinfo(host, portStr.c_str(), &hints, &resolved);
    if (status != 0) {
        logger.error("Failed to resolve listen address " + options_.host + ": " + gai_strerror(status), COMPONENT);
        return false;
    }

    SocketGuard sock(socket(resolved->ai_family, resolved->ai_socktype, resolved->ai_protocol));
    if (!sock) {
        logger.error("Failed to create server socket: " + std::string(strerror(errno)), COMPONENT);
        freeaddrinfo(resolved);
        return false;
    }

    int opt = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    int bound = bind(sock.get(), resolved->ai_addr, resolved->ai_addrlen);
    freeaddrinfo(resolved);
    if (bound < 0) {
        logger.error("Failed to bind " + options_.host + ":" + std::to_string(options_.port) + ": " +
                     strerror(errno), COMPONENT);
        return false;
    }

    if (listen(sock.get(), config::TCP_BACKLOG) < 0) {
        logger.error("Failed to listen: " + std::string(strerror(errno)), COMPONENT);
        return false;
    }

    struct sockaddr_storage local{};
    socklen_t len = sizeof(local);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&local), &len) == 0) {
        port_ = local.ss_family == AF_INET6
            ? ntohs(reinterpret_cast<struct sockaddr_in6*>(&local)->sin6_port)
            : ntohs(reinterpret_cast<struct sockaddr_in*>(&local)->sin_port);
    }

    listenSocket_ = std::move(sock);
    workers_ = std::make_unique<ThreadPool>(options_.workerThreads, options_.maxQueuedConnections);
    running_ = true;
    serverThread_ = std::thread(&RelayHttpServer::serverLoop, this);

    logger.info("Relay listening on " + options_.host + ":" + std::to_string(port_) +
                " with " + std::to_string(workers_->size()) + " worker(s)", COMPONENT);
    return true;
}

void RelayHttpServer::stop() {
    bool wasRunning = running_.exchange(false);

    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    listenSocket_.reset();

    if (workers_) {
        workers_->shutdown();
        workers_.reset();
    }

    if (wasRunning) {
        Logger::instance().info("Relay server stopped", COMPONENT);
    }
}

void RelayHttpServer::serverLoop() {
    while (running_) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listenSocket_.get(), &readfds);

        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;

        int activity = select(listenSocket_.get() + 1, &readfds, nullptr, nullptr, &tv);
        if (activity <= 0) continue;

        struct sockaddr_storage clientAddr{};
        socklen_t len = sizeof(clientAddr);
        SocketGuard client(accept(listenSocket_.get(), reinterpret_cast<struct sockaddr*>(&clientAddr), &len));
        if (!client) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                Logger::instance().warn("accept failed: " + std::string(strerror(errno)), COMPONENT);
            }
            continue;
        }

        std::string remote = peerAddress(clientAddr);
        auto socketHolder = std::make_shared<SocketGuard>(std::move(client));
        auto queued = workers_->tryPost([this, socketHolder, remote]() {
            handleClient(std::move(*socketHolder), remote);
        });
        if (!queued) {
            rejectClient(*socketHolder, remote, queued.error());
        }
    }
}

void RelayHttpServer::rejectClient(SocketGuard& client, const std::string& remoteAddress, const Error& reason) {
    Logger::instance().warn("Turning away " + remoteAddress + ": " + reason.message, COMPONENT);
    MetricsCollector::instance().incrementRateLimited();

    // Short timeouts keep a slow peer from stalling the accept loop
    client.setTimeouts(std::min(options_.ioTimeoutMs, 1000));
    HttpConnection conn(client.get());
    auto written = conn.writeResponse(RelayProtocolHandler::errorResponse(reason));
    if (!written) {
        LOG_DEBUG_COMP_IF("Failed to answer " + remoteAddress + ": " + written.error().message, COMPONENT);
    }
    MetricsCollector::instance().addBytesOut(conn.bytesWritten());
}

void RelayHttpServer::handleClient(SocketGuard client, const std::string& remoteAddress) {
    ++activeConnections_;
    client.setTimeouts(options_.ioTimeoutMs);

    HttpConnection conn(client.get());
    auto request = conn.readRequest(options_.maxBodyBytes);

    HttpResponse response;
    bool drain = false;
    if (request) {
        request->remoteAddress = remoteAddress;
        response = handler_.handle(*request);
    } else {
        const Error& err = request.error();
        if (err.code == ErrorCode::NetworkError || err.code == ErrorCode::Timeout) {
            LOG_DEBUG_COMP_IF("Dropping connection from " + remoteAddress + ": " + err.message, COMPONENT);
            MetricsCollector::instance().addBytesIn(conn.bytesRead());
            --activeConnections_;
            return;
        }
        Logger::instance().warn("Bad request from " + remoteAddress + ": " + err.message, COMPONENT);
        response = RelayProtocolHandler::errorResponse(err);
        drain = true;
    }

    auto written = conn.writeResponse(response);
    if (!written) {
        LOG_DEBUG_COMP_IF("Failed to answer " + remoteAddress + ": " + written.error().message, COMPONENT);
    }
    if (drain) {
        drainInput(client);
    }

    auto& metrics = MetricsCollector::instance();
    metrics.addBytesIn(conn.bytesRead());
    metrics.addBytesOut(conn.bytesWritten());
    --activeConnections_;
}

} // namespace RelayPipe
