#pragma once

#include "Constants.h"
#include "IHttpTransport.h"
#include "Result.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace RelayPipe {

struct RelayUrl {
    std::string host;
    int port = 80;
    std::string basePath;   // without trailing slash, may be empty

    /// Parse "http://host[:port][/base]"; https is rejected
    static Result<RelayUrl> parse(const std::string& url);

    std::string hostHeader() const;
};

/**
 * @brief Blocking HTTP/1.1 client, one TCP connection per exchange
 *
 * Response bodies are capped at maxResponseBytes(). The default fits a peek
 * of a full channel on a relay running the stock max_channel_bytes; call
 * adoptServerLimits() to size the cap from the relay's /supported document.
 */
class HttpClient : public IHttpTransport {
public:
    static constexpr size_t DEFAULT_MAX_RESPONSE_BYTES = config::MAX_CHANNEL_BYTES + config::MAX_FRAME_SIZE;

    explicit HttpClient(RelayUrl url, size_t maxResponseBytes = DEFAULT_MAX_RESPONSE_BYTES)
        : url_(std::move(url)), maxResponseBytes_(maxResponseBytes) {}

    Result<HttpResponse> exchange(const HttpRequest& request,
                                  std::chrono::milliseconds timeout) override;

    /**
     * @brief Fetch /supported and cap responses at the relay's
     *        max_channel_bytes plus one frame
     * @return the new cap; on failure the cap is left unchanged
     */
    Result<size_t> adoptServerLimits(std::chrono::milliseconds timeout);

    const RelayUrl& url() const { return url_; }

    size_t maxResponseBytes() const { return maxResponseBytes_; }
    void setMaxResponseBytes(size_t bytes) { maxResponseBytes_ = bytes; }

private:
    Result<int> connectWithTimeout(int timeoutMs);

    RelayUrl url_;
    size_t maxResponseBytes_;
};

} // namespace RelayPipe
