#pragma once

/**
 * @file HttpMessage.h
 * @brief Minimal HTTP/1.1 messages and blocking socket I/O
 *
 * One request per connection, bodies framed by Content-Length only.
 * Shared by the relay server and HttpClient.
 */

#include "Result.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace RelayPipe {

/**
 * @brief Ordered header list with case-insensitive lookup
 */
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& defaultValue = "") const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";       // path plus optional ?query, as sent
    std::string version = "HTTP/1.1";
    HttpHeaders headers;
    std::vector<uint8_t> body;
    std::string remoteAddress;      // filled in by the server

    std::string path() const;
    std::string query() const;
    std::string queryParam(const std::string& name, const std::string& defaultValue = "") const;
    std::string header(const std::string& name, const std::string& defaultValue = "") const {
        return headers.get(name, defaultValue);
    }
};

struct HttpResponse {
    int status = 200;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string header(const std::string& name, const std::string& defaultValue = "") const {
        return headers.get(name, defaultValue);
    }
    std::string bodyText() const { return std::string(body.begin(), body.end()); }

    static HttpResponse text(int status, const std::string& body,
                             const std::string& contentType = "text/plain; charset=utf-8");
    static HttpResponse json(int status, const std::string& body);
    static HttpResponse binary(int status, std::vector<uint8_t> body);
    static HttpResponse empty(int status);
};

namespace Http {
    const char* reasonPhrase(int status);

    std::string serializeHead(const HttpResponse& response);
    std::string serializeHead(const HttpRequest& request, const std::string& hostHeader);

    VoidResult parseRequestHead(const std::string& head, HttpRequest& out);
    VoidResult parseResponseHead(const std::string& head, HttpResponse& out);

    /// Percent-decode a path segment; false on a malformed escape
    bool urlDecode(const std::string& in, std::string& out);
}

/**
 * @brief Blocking HTTP exchange over a connected socket
 *
 * Does not own the descriptor. Socket timeouts set by the caller surface
 * as ErrorCode::Timeout, other socket failures as NetworkError.
 */
class HttpConnection {
public:
    explicit HttpConnection(int fd) : fd_(fd) {}

    Result<HttpRequest> readRequest(size_t maxBody);
    Result<HttpResponse> readResponse(size_t maxBody);

    VoidResult writeRequest(const HttpRequest& request, const std::string& hostHeader);
    VoidResult writeResponse(const HttpResponse& response);

    uint64_t bytesRead() const { return bytesRead_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

private:
    Result<std::string> readHead();
    VoidResult readBody(size_t length, std::vector<uint8_t>& out);
    VoidResult readUntilClose(size_t maxBody, std::vector<uint8_t>& out);
    VoidResult writeAll(const char* data, size_t len);
    Result<size_t> fill();
    Error ioError(const std::string& what, int err) const;

    int fd_;
    std::string buffer_;   // bytes received but not yet consumed
    uint64_t bytesRead_{0};
    uint64_t bytesWritten_{0};
};

} // namespace RelayPipe
