#include "HttpClient.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "SocketGuard.h"

#include <json/json.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace RelayPipe {

Result<RelayUrl> RelayUrl::parse(const std::string& url) {
    static const std::string HTTP = "http://";
    if (url.rfind("https://", 0) == 0) {
        return Err(ErrorCode::ConfigError, "https is not supported, terminate TLS in front of the relay");
    }
    if (url.rfind(HTTP, 0) != 0) {
        return Err(ErrorCode::ConfigError, "relay url must start with http://: " + url);
    }

    std::string rest = url.substr(HTTP.size());
    RelayUrl parsed;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        parsed.basePath = rest.substr(slash);
        while (!parsed.basePath.empty() && parsed.basePath.back() == '/') {
            parsed.basePath.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parsed.host = authority.substr(0, colon);
        std::string portText = authority.substr(colon + 1);
        try {
            size_t used = 0;
            parsed.port = std::stoi(portText, &used);
            if (used != portText.size()) {
                throw std::invalid_argument(portText);
            }
        } catch (const std::exception&) {
            return Err(ErrorCode::ConfigError, "invalid port in relay url: " + url);
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            return Err(ErrorCode::ConfigError, "port out of range in relay url: " + url);
        }
    } else {
        parsed.host = authority;
    }

    if (parsed.host.empty()) {
        return Err(ErrorCode::ConfigError, "missing host in relay url: " + url);
    }
    return parsed;
}

std::string RelayUrl::hostHeader() const {
    return port == 80 ? host : host + ":" + std::to_string(port);
}

Result<int> HttpClient::connectWithTimeout(int timeoutMs) {
    struct addrinfo hints{};
    struct addrinfo* resolved = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(url_.port);
    int status = getaddrinfo(url_.host.c_str(), portStr.c_str(), &hints, &resolved);
    if (status != 0) {
        return Err(ErrorCode::NetworkError,
                   "failed to resolve " + url_.host + ": " + gai_strerror(status));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> addresses(resolved, freeaddrinfo);

    std::string lastError = "no usable address";
    ErrorCode lastCode = ErrorCode::NetworkError;
    for (auto* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock) {
            lastError = std::string("socket failed: ") + strerror(errno);
            continue;
        }

        // Non-blocking connect so an unreachable relay cannot hang past the timeout
        int flags = fcntl(sock.get(), F_GETFL, 0);
        fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            lastError = std::string("connect failed: ") + strerror(errno);
            continue;
        }

        if (rc < 0) {
            struct pollfd pfd;
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            int pollResult = poll(&pfd, 1, timeoutMs);
            if (pollResult == 0) {
                lastError = "connect timed out";
                lastCode = ErrorCode::Timeout;
                continue;
            }
            if (pollResult < 0) {
                lastError = std::string("poll failed: ") + strerror(errno);
                continue;
            }

            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len);
            if (error != 0) {
                lastError = std::string("connect failed: ") + strerror(error);
                lastCode = ErrorCode::NetworkError;
                continue;
            }
        }

        fcntl(sock.get(), F_SETFL, flags);
        sock.setTimeouts(timeoutMs);
        int noDelay = 1;
        setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
        return sock.release();
    }

    return Err(lastCode, url_.hostHeader() + ": " + lastError);
}

Result<HttpResponse> HttpClient::exchange(const HttpRequest& request,
                                          std::chrono::milliseconds timeout) {
    int timeoutMs = static_cast<int>(std::max<int64_t>(1, timeout.count()));

    auto fd = connectWithTimeout(timeoutMs);
    if (!fd) {
        return fd.error();
    }
    SocketGuard sock(*fd);

    HttpRequest outbound = request;
    outbound.target = url_.basePath + request.target;

    LOG_DEBUG_COMP_IF(request.method + " " + outbound.target, "HttpClient");

    HttpConnection conn(sock.get());
    auto sent = conn.writeRequest(outbound, url_.hostHeader());
    if (!sent) {
        return sent.error();
    }
    return conn.readResponse(maxResponseBytes_);
}

Result<size_t> HttpClient::adoptServerLimits(std::chrono::milliseconds timeout) {
    HttpRequest request;
    request.method = "GET";
    request.target = "/supported";
    auto response = exchange(request, timeout);
    if (!response) {
        return response.error();
    }
    if (response->status != 200) {
        return Err(ErrorCode::ServerError, "/supported answered " + std::to_string(response->status));
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    std::string text = response->bodyText();
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Err(ErrorCode::FormatError, "unreadable /supported document: " + errors);
    }

    const Json::Value& limit = root["limits"]["max_channel_bytes"];
    if (!limit.isUInt64() || limit.asUInt64() == 0) {
        return Err(ErrorCode::FormatError, "/supported carries no max_channel_bytes");
    }

    maxResponseBytes_ = static_cast<size_t>(limit.asUInt64()) + config::MAX_FRAME_SIZE;
    LOG_DEBUG_COMP_IF("Response cap set to " + std::to_string(maxResponseBytes_) + " bytes", "HttpClient");
    return maxResponseBytes_;
}

} // namespace RelayPipe
