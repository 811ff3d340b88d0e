#include "HttpMessage.h"
#include "Constants.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace RelayPipe {

namespace {

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitLines(const std::string& head) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(head);
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

VoidResult parseHeaderLines(const std::vector<std::string>& lines, HttpHeaders& headers) {
    for (size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.empty()) continue;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Err(ErrorCode::FormatError, "malformed header line");
        }
        std::string name = line.substr(0, colon);
        if (name.find_first_of(" \t") != std::string::npos) {
            return Err(ErrorCode::FormatError, "whitespace in header name");
        }
        headers.add(name, trim(line.substr(colon + 1)));
    }
    return Ok();
}

bool parseContentLength(const std::string& value, size_t& out) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// HttpHeaders
// ============================================================================

bool HttpHeaders::equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    entries_.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    entries_.emplace_back(name, value);
}

void HttpHeaders::remove(const std::string& name) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const auto& e) { return equalsIgnoreCase(e.first, name); }),
                   entries_.end());
}

bool HttpHeaders::has(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const auto& e) { return equalsIgnoreCase(e.first, name); });
}

std::string HttpHeaders::get(const std::string& name, const std::string& defaultValue) const {
    for (const auto& e : entries_) {
        if (equalsIgnoreCase(e.first, name)) {
            return e.second;
        }
    }
    return defaultValue;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

std::string HttpRequest::path() const {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string HttpRequest::query() const {
    auto q = target.find('?');
    return q == std::string::npos ? "" : target.substr(q + 1);
}

std::string HttpRequest::queryParam(const std::string& name, const std::string& defaultValue) const {
    std::istringstream stream(query());
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        auto eq = pair.find('=');
        std::string key = pair.substr(0, eq);
        if (key == name) {
            std::string decoded;
            std::string raw = eq == std::string::npos ? "" : pair.substr(eq + 1);
            return Http::urlDecode(raw, decoded) ? decoded : defaultValue;
        }
    }
    return defaultValue;
}

HttpResponse HttpResponse::text(int status, const std::string& body, const std::string& contentType) {
    HttpResponse response;
    response.status = status;
    response.headers.set("Content-Type", contentType);
    response.body.assign(body.begin(), body.end());
    return response;
}

HttpResponse HttpResponse::json(int status, const std::string& body) {
    return text(status, body, "application/json");
}

HttpResponse HttpResponse::binary(int status, std::vector<uint8_t> body) {
    HttpResponse response;
    response.status = status;
    response.headers.set("Content-Type", "application/octet-stream");
    response.body = std::move(body);
    return response;
}

HttpResponse HttpResponse::empty(int status) {
    HttpResponse response;
    response.status = status;
    return response;
}

// ============================================================================
// Http helpers
// ============================================================================

const char* Http::reasonPhrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 507: return "Insufficient Storage";
        default: return "Unknown";
    }
}

std::string Http::serializeHead(const HttpResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << reasonPhrase(response.status) << "\r\n";
    for (const auto& [name, value] : response.headers.entries()) {
        if (HttpHeaders::equalsIgnoreCase(name, "Content-Length") ||
            HttpHeaders::equalsIgnoreCase(name, "Connection")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (response.status != 204 && response.status >= 200) {
        oss << "Content-Length: " << response.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n";
    oss << "\r\n";
    return oss.str();
}

std::string Http::serializeHead(const HttpRequest& request, const std::string& hostHeader) {
    std::ostringstream oss;
    oss << request.method << " " << request.target << " HTTP/1.1\r\n";
    oss << "Host: " << hostHeader << "\r\n";
    for (const auto& [name, value] : request.headers.entries()) {
        if (HttpHeaders::equalsIgnoreCase(name, "Host") ||
            HttpHeaders::equalsIgnoreCase(name, "Content-Length") ||
            HttpHeaders::equalsIgnoreCase(name, "Connection")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        oss << "Content-Length: " << request.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n";
    oss << "\r\n";
    return oss.str();
}

VoidResult Http::parseRequestHead(const std::string& head, HttpRequest& out) {
    auto lines = splitLines(head);
    if (lines.empty()) {
        return Err(ErrorCode::FormatError, "empty request");
    }

    std::istringstream requestLine(lines[0]);
    std::string method, target, version, extra;
    requestLine >> method >> target >> version;
    if (method.empty() || target.empty() || version.empty() || (requestLine >> extra)) {
        return Err(ErrorCode::FormatError, "malformed request line");
    }
    if (version.rfind("HTTP/1.", 0) != 0) {
        return Err(ErrorCode::FormatError, "unsupported HTTP version " + version);
    }
    if (target[0] != '/') {
        return Err(ErrorCode::FormatError, "request target must be an absolute path");
    }

    out.method = method;
    out.target = target;
    out.version = version;
    return parseHeaderLines(lines, out.headers);
}

VoidResult Http::parseResponseHead(const std::string& head, HttpResponse& out) {
    auto lines = splitLines(head);
    if (lines.empty()) {
        return Err(ErrorCode::FormatError, "empty response");
    }

    std::istringstream statusLine(lines[0]);
    std::string version;
    int status = 0;
    statusLine >> version >> status;
    if (version.rfind("HTTP/1.", 0) != 0 || status < 100 || status > 599) {
        return Err(ErrorCode::FormatError, "malformed status line");
    }

    out.status = status;
    out.headers = HttpHeaders();
    return parseHeaderLines(lines, out.headers);
}

bool Http::urlDecode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 2 >= in.size()) return false;
            int hi = hexDigit(in[i + 1]);
            int lo = hexDigit(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return true;
}

// ============================================================================
// HttpConnection
// ============================================================================

Error HttpConnection::ioError(const std::string& what, int err) const {
    if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
        return Err(ErrorCode::Timeout, what + ": timed out");
    }
    return Err(ErrorCode::NetworkError, what + ": " + std::strerror(err));
}

Result<size_t> HttpConnection::fill() {
    char tmp[16384];
    for (;;) {
        ssize_t n = recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return ioError("recv failed", errno);
        }
        buffer_.append(tmp, static_cast<size_t>(n));
        bytesRead_ += static_cast<uint64_t>(n);
        return static_cast<size_t>(n);
    }
}

Result<std::string> HttpConnection::readHead() {
    for (;;) {
        auto end = buffer_.find("\r\n\r\n");
        if (end != std::string::npos) {
            std::string head = buffer_.substr(0, end);
            buffer_.erase(0, end + 4);
            return head;
        }
        if (buffer_.size() > config::MAX_HEADER_BYTES) {
            return Err(ErrorCode::TooLarge, "request head too large");
        }
        auto n = fill();
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            if (buffer_.empty()) {
                return Err(ErrorCode::NetworkError, "connection closed by peer");
            }
            return Err(ErrorCode::FormatError, "connection closed inside message head");
        }
    }
}

VoidResult HttpConnection::readBody(size_t length, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(length);

    size_t fromBuffer = std::min(length, buffer_.size());
    out.insert(out.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(fromBuffer));
    buffer_.erase(0, fromBuffer);

    while (out.size() < length) {
        auto n = fill();
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            return Err(ErrorCode::NetworkError, "connection closed inside message body");
        }
        size_t take = std::min(length - out.size(), buffer_.size());
        out.insert(out.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(take));
        buffer_.erase(0, take);
    }
    return Ok();
}

VoidResult HttpConnection::readUntilClose(size_t maxBody, std::vector<uint8_t>& out) {
    out.assign(buffer_.begin(), buffer_.end());
    buffer_.clear();
    for (;;) {
        if (out.size() > maxBody) {
            return Err(ErrorCode::TooLarge, "response body too large");
        }
        auto n = fill();
        if (!n) {
            return n.error();
        }
        if (*n == 0) {
            return Ok();
        }
        out.insert(out.end(), buffer_.begin(), buffer_.end());
        buffer_.clear();
    }
}

Result<HttpRequest> HttpConnection::readRequest(size_t maxBody) {
    auto head = readHead();
    if (!head) {
        return head.error();
    }

    HttpRequest request;
    auto parsed = Http::parseRequestHead(*head, request);
    if (!parsed) {
        return parsed.error();
    }

    if (request.headers.has("Transfer-Encoding")) {
        return Err(ErrorCode::FormatError, "chunked transfer encoding is not supported");
    }

    size_t length = 0;
    if (request.headers.has("Content-Length") &&
        !parseContentLength(request.headers.get("Content-Length"), length)) {
        return Err(ErrorCode::FormatError, "invalid Content-Length");
    }
    if (length > maxBody) {
        return Err(ErrorCode::TooLarge, "request body of " + std::to_string(length) + " bytes exceeds " +
                                        std::to_string(maxBody));
    }

    // curl waits for this before sending large bodies
    if (length > buffer_.size() &&
        HttpHeaders::equalsIgnoreCase(request.headers.get("Expect"), "100-continue")) {
        static const char CONTINUE[] = "HTTP/1.1 100 Continue\r\n\r\n";
        auto sent = writeAll(CONTINUE, sizeof(CONTINUE) - 1);
        if (!sent) {
            return sent.error();
        }
    }

    auto body = readBody(length, request.body);
    if (!body) {
        return body.error();
    }
    return request;
}

Result<HttpResponse> HttpConnection::readResponse(size_t maxBody) {
    HttpResponse response;
    do {
        auto head = readHead();
        if (!head) {
            return head.error();
        }
        auto parsed = Http::parseResponseHead(*head, response);
        if (!parsed) {
            return parsed.error();
        }
    } while (response.status < 200);

    if (response.status == 204 || response.status == 304) {
        return response;
    }

    if (response.headers.has("Content-Length")) {
        size_t length = 0;
        if (!parseContentLength(response.headers.get("Content-Length"), length)) {
            return Err(ErrorCode::FormatError, "invalid Content-Length");
        }
        if (length > maxBody) {
            return Err(ErrorCode::TooLarge, "response body too large");
        }
        auto body = readBody(length, response.body);
        if (!body) {
            return body.error();
        }
        return response;
    }

    auto body = readUntilClose(maxBody, response.body);
    if (!body) {
        return body.error();
    }
    return response;
}

VoidResult HttpConnection::writeAll(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return ioError("send failed", errno);
        }
        sent += static_cast<size_t>(n);
    }
    bytesWritten_ += len;
    return Ok();
}

VoidResult HttpConnection::writeRequest(const HttpRequest& request, const std::string& hostHeader) {
    std::string head = Http::serializeHead(request, hostHeader);
    auto result = writeAll(head.data(), head.size());
    if (!result || request.body.empty()) {
        return result;
    }
    return writeAll(reinterpret_cast<const char*>(request.body.data()), request.body.size());
}

VoidResult HttpConnection::writeResponse(const HttpResponse& response) {
    std::string head = Http::serializeHead(response);
    auto result = writeAll(head.data(), head.size());
    if (!result || response.body.empty() || response.status == 204) {
        return result;
    }
    return writeAll(reinterpret_cast<const char*>(response.body.data()), response.body.size());
}

} // namespace RelayPipe
