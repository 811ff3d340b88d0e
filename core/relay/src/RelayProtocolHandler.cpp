#include "RelayProtocolHandler.h"
#include "ChunkCodec.h"
#include "Compression.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "Version.h"

#include <json/json.h>

#include <algorithm>
#include <sstream>

namespace RelayPipe {

namespace {

const char* COMPONENT = "RelayHandler";

const char* HELP_TEXT =
    "RelayPipe store-and-forward relay\n"
    "\n"
    "Channels live under /c/<channel>:\n"
    "  POST or PUT   push one chunk frame\n"
    "  GET           pop the next chunk frame (X-Wait-Ms to long-poll)\n"
    "  DELETE        delete the channel\n"
    "  GET /p/<channel>    peek at the queued frames without consuming them\n"
    "  GET /q/<channel>    channel information as JSON\n"
    "\n"
    "Plaintext access without the client: POST a body to /web/<channel> and\n"
    "GET /web/<channel> to read it back. The web path cannot read encrypted data.\n"
    "\n"
    "Channel names use A-Z a-z 0-9 . _ ~ - and are at most 256 bytes.\n"
    "Use the relaypipe client for compression, encryption and streams larger\n"
    "than a single chunk.\n";

std::string toJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value) + "\n";
}

bool parseIntHeader(const std::string& text, long long& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t used = 0;
        out = std::stoll(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

/// Split "/c/name" into ("c", "name"); empty prefix when the path has no channel part
bool splitChannelPath(const std::string& path, std::string& prefix, std::string& channel) {
    if (path.size() < 2 || path[0] != '/') {
        return false;
    }
    auto slash = path.find('/', 1);
    if (slash == std::string::npos) {
        return false;
    }
    prefix = path.substr(1, slash - 1);
    return Http::urlDecode(path.substr(slash + 1), channel);
}

HttpResponse encryptedOnWebPath() {
    HttpResponse response = RelayProtocolHandler::errorResponse(
        Err(ErrorCode::FormatError, "web path cannot read encrypted data, use the relaypipe client"));
    response.status = 422;
    return response;
}

void setChunkHeaders(HttpResponse& response, const PopResult& popped) {
    response.headers.set(RelayHeaders::SEQUENCE, std::to_string(popped.chunk.sequence));
    response.headers.set(RelayHeaders::CHANNEL_ID, popped.channelId);
    response.headers.set(RelayHeaders::FINAL, popped.final ? "1" : "0");
}

} // namespace

RelayProtocolHandler::RelayProtocolHandler(ChannelStore& store, RelayHandlerOptions options)
    : store_(store)
    , options_(options)
    , rateLimiter_(options.rateLimitRps, options.rateLimitBurst) {
}

void RelayProtocolHandler::setHealthCollector(HealthCollector collector) {
    std::lock_guard<std::mutex> lock(healthMutex_);
    healthCollector_ = std::move(collector);
}

void RelayProtocolHandler::beginShutdown() {
    if (shuttingDown_.exchange(true)) {
        return;
    }
    ready_ = false;
    store_.shutdown();
    Logger::instance().info("Refusing new channel operations, shutting down", COMPONENT);
}

int RelayProtocolHandler::statusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return 200;
        case ErrorCode::AuthError: return 401;
        case ErrorCode::Locked: return 423;
        case ErrorCode::Empty: return 204;
        case ErrorCode::Expired: return 410;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::ChannelFull: return 507;
        case ErrorCode::IntegrityError:
        case ErrorCode::FormatError:
        case ErrorCode::InvalidArgument: return 400;
        case ErrorCode::TooLarge: return 413;
        case ErrorCode::RateLimited: return 429;
        case ErrorCode::ShuttingDown: return 503;
        default: return 500;
    }
}

HttpResponse RelayProtocolHandler::errorResponse(const Error& error) {
    int status = statusFor(error.code);
    HttpResponse response = status == 204 ? HttpResponse::empty(status)
                                          : HttpResponse::text(status, error.message + "\n");
    response.headers.set(RelayHeaders::ERROR_CODE, std::to_string(static_cast<int>(error.code)));
    if (error.code == ErrorCode::AuthError) {
        response.headers.set(RelayHeaders::AUTH_FAILURE, error.message);
    }
    return response;
}

HttpResponse RelayProtocolHandler::handle(const HttpRequest& request) {
    MetricsCollector::instance().incrementRequests();
    try {
        HttpResponse response = dispatch(request);
        if (response.status >= 500) {
            MetricsCollector::instance().incrementServerErrors();
        }
        return response;
    } catch (const std::exception& e) {
        MetricsCollector::instance().incrementServerErrors();
        Logger::instance().error("Unhandled failure on " + request.method + " " + request.path() +
                                 ": " + e.what(), COMPONENT);
        return errorResponse(Err(ErrorCode::InternalError, "internal server error"));
    }
}

HttpResponse RelayProtocolHandler::dispatch(const HttpRequest& request) {
    const std::string path = request.path();
    const std::string& method = request.method;

    LOG_DEBUG_COMP_IF(method + " " + path + " from " + request.remoteAddress, COMPONENT);

    // Monitoring routes are exempt from rate limiting and shutdown
    if (path == "/health") return handleHealth();
    if (path == "/live") return HttpResponse::json(200, "{\"alive\": true}\n");
    if (path == "/ready") {
        return ready_ ? HttpResponse::json(200, "{\"ready\": true}\n")
                      : HttpResponse::json(503, "{\"ready\": false}\n");
    }
    if (path == "/metrics") return handleMetrics();

    if (!rateLimiter_.allow(request.remoteAddress)) {
        MetricsCollector::instance().incrementRateLimited();
        return errorResponse(Err(ErrorCode::RateLimited, "too many requests"));
    }

    if (path == "/" || path == "/help") return handleHelp();
    if (path == "/version") return HttpResponse::text(200, Version::toString() + "\n");
    if (path == "/supported") return handleSupported();

    std::string prefix;
    std::string channel;
    if (!splitChannelPath(path, prefix, channel) ||
        (prefix != "c" && prefix != "p" && prefix != "q" && prefix != "web")) {
        return HttpResponse::text(404, "404: Not found\n");
    }
    if (!ChannelStore::isValidChannelName(channel)) {
        return errorResponse(Err(ErrorCode::InvalidArgument, "invalid channel name"));
    }

    if (shuttingDown_) {
        return errorResponse(Err(ErrorCode::ShuttingDown, "server is shutting down"));
    }

    if (prefix == "c") {
        if (method == "POST" || method == "PUT") return handleSend(channel, request);
        if (method == "GET") return handleReceive(channel, request);
        if (method == "DELETE") return handleClear(channel, request);
    } else if (prefix == "p") {
        if (method == "GET") return handlePeek(channel, request);
    } else if (prefix == "q") {
        if (method == "GET") return handleQuery(channel);
    } else {
        if (method == "GET") return handleWebRead(channel, request);
        if (method == "POST" || method == "PUT") return handleWebWrite(channel, request);
    }

    HttpResponse response = HttpResponse::text(405, "405: Method not allowed\n");
    response.headers.set("Allow", prefix == "c" ? "GET, POST, PUT, DELETE" :
                                  prefix == "web" ? "GET, POST, PUT" : "GET");
    return response;
}

HttpResponse RelayProtocolHandler::handleSend(const std::string& channel, const HttpRequest& request) {
    auto parsed = ChunkFrame::parse(request.body);
    if (!parsed) {
        Logger::instance().warn("Rejected frame on " + channel + ": " + parsed.error().message, COMPONENT);
        return errorResponse(parsed.error());
    }

    long long ttl = 0;
    std::string ttlHeader = request.header(RelayHeaders::TTL);
    if (!ttlHeader.empty() && (!parseIntHeader(ttlHeader, ttl) || ttl < 0)) {
        return errorResponse(Err(ErrorCode::InvalidArgument, "invalid " + std::string(RelayHeaders::TTL)));
    }
    ttl = std::min<long long>(ttl, store_.options().maxTtl.count());

    Chunk chunk = std::move(parsed.value());
    chunk.producerId = request.header(RelayHeaders::PRODUCER_ID);

    auto receipt = store_.push(channel,
                               request.header(RelayHeaders::AUTH),
                               std::move(chunk),
                               request.header(RelayHeaders::CHANNEL_ID),
                               static_cast<int>(ttl));
    if (!receipt) {
        return errorResponse(receipt.error());
    }

    HttpResponse response = HttpResponse::empty(receipt->duplicate ? 200 : 201);
    response.headers.set(RelayHeaders::SEQUENCE, std::to_string(receipt->sequence));
    response.headers.set(RelayHeaders::CHANNEL_ID, receipt->channelId);
    response.headers.set(RelayHeaders::DUPLICATE, receipt->duplicate ? "1" : "0");
    response.headers.set(RelayHeaders::MAX_CHUNK_SIZE, std::to_string(config::MAX_CHUNK_PLAINTEXT));
    return response;
}

Result<PopResult> RelayProtocolHandler::popWithWait(const std::string& channel,
                                                    const HttpRequest& request,
                                                    const std::string& lockToken,
                                                    const std::string& expectedChannelId) {
    const std::string credential = request.header(RelayHeaders::AUTH);
    auto popped = store_.pop(channel, credential, lockToken, expectedChannelId);

    long long waitMs = 0;
    if (!parseIntHeader(request.header(RelayHeaders::WAIT_MS), waitMs) || waitMs <= 0) {
        return popped;
    }
    waitMs = std::min<long long>(waitMs, options_.maxWaitMs);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(waitMs);
    while (!popped && popped.error().code == ErrorCode::Empty && !shuttingDown_ &&
           std::chrono::steady_clock::now() < deadline) {
        if (!store_.waitForData(channel, deadline)) {
            // Deadline, eviction or shutdown: one last attempt decides the answer
            return store_.pop(channel, credential, lockToken, expectedChannelId);
        }
        popped = store_.pop(channel, credential, lockToken, expectedChannelId);
    }
    return popped;
}

HttpResponse RelayProtocolHandler::handleReceive(const std::string& channel, const HttpRequest& request) {
    auto popped = popWithWait(channel, request,
                              request.header(RelayHeaders::LOCK_TOKEN),
                              request.header(RelayHeaders::CHANNEL_ID));
    if (!popped) {
        return errorResponse(popped.error());
    }

    HttpResponse response = HttpResponse::binary(200, ChunkFrame::serialize(popped->chunk));
    setChunkHeaders(response, *popped);
    if (!popped->lockToken.empty()) {
        response.headers.set(RelayHeaders::LOCK_TOKEN, popped->lockToken);
    }
    return response;
}

HttpResponse RelayProtocolHandler::handleClear(const std::string& channel, const HttpRequest& request) {
    auto cleared = store_.clear(channel, request.header(RelayHeaders::AUTH));
    if (!cleared) {
        return errorResponse(cleared.error());
    }
    return HttpResponse::text(200, "Channel " + channel + " deleted\n");
}

HttpResponse RelayProtocolHandler::handlePeek(const std::string& channel, const HttpRequest& request) {
    auto snapshot = store_.peek(channel, request.header(RelayHeaders::AUTH));
    if (!snapshot) {
        return errorResponse(snapshot.error());
    }

    std::vector<uint8_t> body;
    size_t total = 0;
    for (const auto& chunk : snapshot->chunks) {
        total += chunk.frameSize();
    }
    body.reserve(total);
    for (const auto& chunk : snapshot->chunks) {
        ChunkFrame::appendTo(chunk, body);
    }

    HttpResponse response = HttpResponse::binary(200, std::move(body));
    response.headers.set(RelayHeaders::CHANNEL_ID, snapshot->channelId);
    response.headers.set(RelayHeaders::CHUNK_COUNT, std::to_string(snapshot->chunks.size()));
    response.headers.set(RelayHeaders::STREAM_COMPLETE, snapshot->complete ? "1" : "0");
    return response;
}

HttpResponse RelayProtocolHandler::handleQuery(const std::string& channel) {
    auto info = store_.query(channel);
    if (!info) {
        return errorResponse(info.error());
    }

    Json::Value root(Json::objectValue);
    root["name"] = info->name;
    root["channel_id"] = info->channelId;
    root["chunks"] = static_cast<Json::UInt64>(info->chunkCount);
    root["bytes"] = static_cast<Json::UInt64>(info->queuedBytes);
    root["established"] = info->established;
    root["password_protected"] = info->passwordProtected;
    root["encrypted"] = info->encrypted;
    root["locked"] = info->locked;
    root["complete"] = info->complete;
    root["age_sec"] = static_cast<Json::Int64>(info->ageSec);
    root["idle_sec"] = static_cast<Json::Int64>(info->idleSec);
    root["ttl_sec"] = info->ttlSec;
    root["next_sequence"] = static_cast<Json::UInt64>(info->nextSequence);
    root["pushes"] = static_cast<Json::UInt64>(info->pushes);
    root["pops"] = static_cast<Json::UInt64>(info->pops);
    return HttpResponse::json(200, toJson(root));
}

HttpResponse RelayProtocolHandler::handleWebWrite(const std::string& channel, const HttpRequest& request) {
    if (request.body.size() > config::MAX_WEB_BODY) {
        return errorResponse(Err(ErrorCode::TooLarge, "web uploads are limited to " +
                                                      std::to_string(config::MAX_WEB_BODY) + " bytes"));
    }

    Chunk chunk = ChunkCodec::makePlainChunk(request.body);
    chunk.producerId = request.header(RelayHeaders::PRODUCER_ID);

    auto receipt = store_.push(channel, request.header(RelayHeaders::AUTH), std::move(chunk));
    if (!receipt) {
        return errorResponse(receipt.error());
    }

    HttpResponse response = HttpResponse::text(201, "Stored " + std::to_string(request.body.size()) +
                                                    " bytes in " + channel + "\n");
    response.headers.set(RelayHeaders::CHANNEL_ID, receipt->channelId);
    response.headers.set(RelayHeaders::SEQUENCE, std::to_string(receipt->sequence));
    return response;
}

HttpResponse RelayProtocolHandler::handleWebRead(const std::string& channel, const HttpRequest& request) {
    const std::string credential = request.header(RelayHeaders::AUTH);

    // Check before consuming anything so encrypted data stays in place for a real client
    auto snapshot = store_.peek(channel, credential);
    if (!snapshot) {
        return errorResponse(snapshot.error());
    }
    for (const auto& chunk : snapshot->chunks) {
        if (chunk.isEncrypted()) {
            return encryptedOnWebPath();
        }
    }
    if (!snapshot->complete) {
        HttpResponse response = HttpResponse::empty(204);
        response.headers.set(RelayHeaders::STREAM_COMPLETE, "0");
        return response;
    }

    // Decode the whole stream up front so a corrupt chunk is reported before anything is consumed
    std::vector<std::vector<uint8_t>> plains;
    for (const auto& chunk : snapshot->chunks) {
        auto plain = ChunkCodec::decode(chunk, nullptr);
        if (!plain) {
            Logger::instance().warn("Web read on " + channel + " refused: " + plain.error().message, COMPONENT);
            return errorResponse(plain.error());
        }
        plains.push_back(std::move(*plain));
        if (chunk.isFinal()) {
            break;
        }
    }

    const std::string lockToken = Crypto::randomToken();
    const std::string channelId = snapshot->channelId;
    std::vector<uint8_t> body;
    size_t consumed = 0;

    auto partial = [&](const Error& error) {
        if (consumed == 0) {
            return errorResponse(error);
        }
        Logger::instance().warn("Web read on " + channel + " stopped after " + std::to_string(consumed) +
                                " chunk(s): " + error.message, COMPONENT);
        HttpResponse response = HttpResponse::binary(200, std::move(body));
        response.headers.set(RelayHeaders::CHANNEL_ID, channelId);
        response.headers.set(RelayHeaders::STREAM_COMPLETE, "0");
        response.headers.set(RelayHeaders::ERROR_CODE, std::to_string(static_cast<int>(error.code)));
        return response;
    };

    for (;;) {
        auto popped = store_.pop(channel, credential, lockToken, channelId);
        if (!popped) {
            return partial(popped.error());
        }
        ++consumed;
        if (popped->chunk.isEncrypted()) {
            Logger::instance().warn("Encrypted chunk reached the web path on " + channel, COMPONENT);
            if (consumed == 1) {
                return encryptedOnWebPath();
            }
            return partial(Err(ErrorCode::FormatError, "encrypted chunk on the web path"));
        }

        size_t slot = consumed - 1;
        if (slot < plains.size() && snapshot->chunks[slot].sequence == popped->chunk.sequence) {
            body.insert(body.end(), plains[slot].begin(), plains[slot].end());
        } else {
            auto plain = ChunkCodec::decode(popped->chunk, nullptr);
            if (!plain) {
                return partial(plain.error());
            }
            body.insert(body.end(), plain->begin(), plain->end());
        }
        if (popped->final) {
            break;
        }
    }

    HttpResponse response = HttpResponse::binary(200, std::move(body));
    response.headers.set(RelayHeaders::CHANNEL_ID, channelId);
    response.headers.set(RelayHeaders::STREAM_COMPLETE, "1");
    return response;
}

HttpResponse RelayProtocolHandler::handleHelp() const {
    return HttpResponse::text(200, HELP_TEXT);
}

HttpResponse RelayProtocolHandler::handleSupported() const {
    Json::Value root(Json::objectValue);
    root["version"] = Version::toString();
    root["protocol"] = static_cast<int>(Version::PROTOCOL);
    root["frame_version"] = static_cast<int>(ChunkFrame::VERSION);

    Json::Value compression(Json::arrayValue);
    for (int id = 0; id < 256; ++id) {
        if (Compression::isSupported(static_cast<uint8_t>(id))) compression.append(id);
    }
    root["compression"] = compression;

    Json::Value ciphers(Json::arrayValue);
    for (int id = 0; id < 256; ++id) {
        if (Crypto::isSupported(static_cast<uint8_t>(id))) ciphers.append(id);
    }
    root["ciphers"] = ciphers;

    const auto& opts = store_.options();
    Json::Value limits(Json::objectValue);
    limits["max_chunk_size"] = static_cast<Json::UInt64>(config::MAX_CHUNK_PLAINTEXT);
    limits["max_frame_size"] = static_cast<Json::UInt64>(config::MAX_FRAME_SIZE);
    limits["max_channel_bytes"] = static_cast<Json::UInt64>(opts.maxChannelBytes);
    limits["max_channel_name"] = static_cast<Json::UInt64>(config::MAX_CHANNEL_NAME);
    limits["default_ttl_sec"] = static_cast<Json::Int64>(opts.defaultTtl.count());
    limits["max_ttl_sec"] = static_cast<Json::Int64>(opts.maxTtl.count());
    limits["max_wait_ms"] = options_.maxWaitMs;
    limits["kdf_iterations"] = config::KDF_ITERATIONS;
    root["limits"] = limits;

    return HttpResponse::json(200, toJson(root));
}

HttpResponse RelayProtocolHandler::handleHealth() {
    std::vector<HealthCheck> checks;
    {
        std::lock_guard<std::mutex> lock(healthMutex_);
        if (healthCollector_) {
            checks = healthCollector_();
        }
    }
    checks.emplace_back("channel_store", HealthStatus::Healthy,
                        std::to_string(store_.channelCount()) + " channel(s)");
    if (shuttingDown_) {
        checks.emplace_back("server", HealthStatus::Degraded, "shutting down");
    }

    bool allHealthy = true;
    bool anyUnhealthy = false;
    Json::Value checkList(Json::arrayValue);
    for (const auto& check : checks) {
        if (check.status != HealthStatus::Healthy) allHealthy = false;
        if (check.status == HealthStatus::Unhealthy) anyUnhealthy = true;

        Json::Value item(Json::objectValue);
        item["name"] = check.name;
        item["status"] = healthStatusToString(check.status);
        if (!check.message.empty()) {
            item["message"] = check.message;
        }
        checkList.append(item);
    }

    Json::Value root(Json::objectValue);
    root["status"] = anyUnhealthy ? "unhealthy" : (allHealthy ? "healthy" : "degraded");
    root["version"] = Version::toString();
    root["checks"] = checkList;
    return HttpResponse::json(anyUnhealthy ? 503 : 200, toJson(root));
}

HttpResponse RelayProtocolHandler::handleMetrics() const {
    std::ostringstream oss;
    oss << MetricsCollector::instance().exportPrometheus();
    oss << "# HELP relaypipe_ready Whether the relay accepts channel operations\n";
    oss << "# TYPE relaypipe_ready gauge\n";
    oss << "relaypipe_ready " << (ready_ ? 1 : 0) << "\n";
    return HttpResponse::text(200, oss.str(), "text/plain; version=0.0.4");
}

} // namespace RelayPipe
