#pragma once

#include "HttpMessage.h"
#include "Result.h"

#include <chrono>

namespace RelayPipe {

/**
 * @brief One HTTP request/response exchange with the relay
 *
 * Transfer sessions talk to the relay only through this interface so that
 * tests can route requests straight into a RelayProtocolHandler.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * @brief Send a request and wait for the response
     * @param request Target is relative to the transport's base URL
     * @param timeout Bound on the whole exchange; exceeding it yields ErrorCode::Timeout
     * @return The response for any HTTP status, or NetworkError/Timeout
     */
    virtual Result<HttpResponse> exchange(const HttpRequest& request,
                                          std::chrono::milliseconds timeout) = 0;
};

} // namespace RelayPipe
