#include "TransferSession.h"
#include "Crypto.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "RelayProtocolHandler.h"

#include <json/json.h>

#include <algorithm>
#include <map>
#include <sstream>

namespace RelayPipe {

namespace {

const char* COMPONENT = "TransferSession";

using SteadyClock = std::chrono::steady_clock;

std::optional<ErrorCode> knownErrorCode(int value) {
    switch (static_cast<ErrorCode>(value)) {
        case ErrorCode::AuthError:
        case ErrorCode::Locked:
        case ErrorCode::Empty:
        case ErrorCode::Expired:
        case ErrorCode::NotFound:
        case ErrorCode::ChannelFull:
        case ErrorCode::IntegrityError:
        case ErrorCode::FormatError:
        case ErrorCode::TooLarge:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
        case ErrorCode::ShuttingDown:
        case ErrorCode::Cancelled:
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:
        case ErrorCode::StorageError:
        case ErrorCode::InternalError:
            return static_cast<ErrorCode>(value);
        default:
            return std::nullopt;
    }
}

ErrorCode errorCodeForStatus(int status) {
    switch (status) {
        case 204: return ErrorCode::Empty;
        case 400: return ErrorCode::FormatError;
        case 401: return ErrorCode::AuthError;
        case 404: return ErrorCode::NotFound;
        case 410: return ErrorCode::Expired;
        case 413: return ErrorCode::TooLarge;
        case 422: return ErrorCode::FormatError;
        case 423: return ErrorCode::Locked;
        case 429: return ErrorCode::RateLimited;
        case 503: return ErrorCode::ShuttingDown;
        case 507: return ErrorCode::ChannelFull;
        default: return ErrorCode::ServerError;
    }
}

bool shouldRetry(ErrorCode code) {
    // A restarting relay answers 503 until it is back
    return isRetryable(code) || code == ErrorCode::ShuttingDown;
}

std::string formatMs(std::chrono::milliseconds ms) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << (static_cast<double>(ms.count()) / 1000.0) << "s";
    return oss.str();
}

} // namespace

TransferSession::TransferSession(IHttpTransport& transport,
                                 std::string channel,
                                 std::string password,
                                 SessionOptions options)
    : transport_(transport)
    , options_(options) {
    descriptor_.channel = std::move(channel);
    descriptor_.compress = options_.compress;
    if (!password.empty()) {
        descriptor_.credential = Crypto::channelCredential(password);
        descriptor_.key = std::make_shared<ChannelKey>(std::move(password), options_.kdfIterations);
    }
}

ThreadPool& TransferSession::pool() {
    return options_.pool ? *options_.pool : ThreadPool::global();
}

std::chrono::milliseconds TransferSession::backoffDelay(int attempt) {
    static const std::map<int, int> ladderMs = {{0, 300}, {1, 500}, {5, 1000}, {60, 2000}, {300, 5000}};
    auto it = ladderMs.upper_bound(std::max(0, attempt));
    --it;
    return std::chrono::milliseconds(it->second);
}

Error TransferSession::errorFromResponse(const HttpResponse& response) {
    std::string message = response.bodyText();
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r' || message.back() == ' ')) {
        message.pop_back();
    }
    if (message.empty()) {
        message = "HTTP " + std::to_string(response.status) + " " + Http::reasonPhrase(response.status);
    }

    ErrorCode code = errorCodeForStatus(response.status);
    std::string codeHeader = response.header(RelayHeaders::ERROR_CODE);
    if (!codeHeader.empty()) {
        try {
            if (auto known = knownErrorCode(std::stoi(codeHeader))) {
                code = *known;
            }
        } catch (const std::exception&) {
            Logger::instance().debug("Ignoring malformed error code header: " + codeHeader, COMPONENT);
        }
    }

    std::string authFailure = response.header(RelayHeaders::AUTH_FAILURE);
    if (code == ErrorCode::AuthError && !authFailure.empty()) {
        message = authFailure;
    }
    return Err(code, message);
}

void TransferSession::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        cancelled_ = true;
    }
    cancelCv_.notify_all();
}

bool TransferSession::pause(std::chrono::milliseconds delay) {
    auto scaled = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(delay.count()) * options_.backoffScale));
    std::unique_lock<std::mutex> lock(cancelMutex_);
    cancelCv_.wait_for(lock, scaled, [this]() { return cancelled_.load(); });
    return !cancelled_;
}

HttpRequest TransferSession::makeRequest(const std::string& method, const std::string& prefix) const {
    HttpRequest request;
    request.method = method;
    request.target = "/" + prefix + "/" + descriptor_.channel;
    if (!descriptor_.credential.empty()) {
        request.headers.set(RelayHeaders::AUTH, descriptor_.credential);
    }
    return request;
}

Result<HttpResponse> TransferSession::exchangeWithRetry(const HttpRequest& request, const char* what) {
    const auto started = SteadyClock::now();
    int attempt = 0;

    for (;;) {
        if (cancelled_) {
            return Err(ErrorCode::Cancelled, std::string(what) + " cancelled");
        }

        auto result = transport_.exchange(request, options_.requestTimeout);
        if (result && result->status >= 200 && result->status < 300) {
            return result;
        }
        Error error = result ? errorFromResponse(*result) : result.error();

        if (!shouldRetry(error.code)) {
            return error;
        }

        ++attempt;
        // A full channel drains at the receiver's pace, so it is bounded by
        // the idle timeout rather than the retry count
        bool budgetLeft = error.code == ErrorCode::ChannelFull
            ? SteadyClock::now() - started < options_.idleTimeout
            : attempt < options_.maxRetries;
        if (!budgetLeft) {
            Logger::instance().error(std::string(what) + " on " + descriptor_.channel + " gave up after " +
                                     std::to_string(attempt) + " attempt(s): " + error.toString(), COMPONENT);
            return error;
        }

        auto delay = backoffDelay(attempt - 1);
        MetricsCollector::instance().incrementRetries();
        Logger::instance().info(std::string(what) + " on " + descriptor_.channel + ": " + error.toString() +
                                ", retrying in " + formatMs(delay), COMPONENT);
        if (!pause(delay)) {
            return Err(ErrorCode::Cancelled, std::string(what) + " cancelled");
        }
    }
}

VoidResult TransferSession::send(const std::vector<uint8_t>& data) {
    SCOPED_TIMER_COMP("send " + descriptor_.channel, COMPONENT);
    auto& metrics = MetricsCollector::instance();

    auto fail = [&](const Error& error) -> VoidResult {
        metrics.incrementTransfersFailed();
        Logger::instance().error("Send to " + descriptor_.channel + " failed: " + error.toString(), COMPONENT);
        return error;
    };

    descriptor_.acknowledged.clear();
    descriptor_.channelId.clear();
    try {
        descriptor_.producerId = Crypto::randomToken();
        descriptor_.streamChecksum = SHA256::digest(data);
    } catch (const std::exception& e) {
        return fail(Err(ErrorCode::InternalError, e.what()));
    }

    EncodeOptions encodeOptions;
    encodeOptions.compress = descriptor_.compress;
    auto chunks = ChunkCodec::encodeParallel(data, descriptor_.key.get(), encodeOptions, pool());
    if (!chunks) {
        return fail(chunks.error());
    }

    for (const auto& chunk : *chunks) {
        auto& acked = descriptor_.acknowledged;
        if (std::find(acked.begin(), acked.end(), chunk.producerIndex) != acked.end()) {
            continue;
        }

        HttpRequest request = makeRequest("POST", "c");
        request.headers.set(RelayHeaders::PRODUCER_ID, descriptor_.producerId);
        if (!descriptor_.channelId.empty()) {
            request.headers.set(RelayHeaders::CHANNEL_ID, descriptor_.channelId);
        } else if (options_.ttlSec > 0) {
            request.headers.set(RelayHeaders::TTL, std::to_string(options_.ttlSec));
        }
        request.body = ChunkFrame::serialize(chunk);

        auto response = exchangeWithRetry(request, "send");
        if (!response) {
            return fail(response.error());
        }

        if (descriptor_.channelId.empty()) {
            descriptor_.channelId = response->header(RelayHeaders::CHANNEL_ID);
        }
        acked.push_back(chunk.producerIndex);
        LOG_DEBUG_COMP_IF("Chunk " + std::to_string(chunk.producerIndex) + " stored as #" +
                          response->header(RelayHeaders::SEQUENCE) +
                          (response->header(RelayHeaders::DUPLICATE) == "1" ? " (duplicate)" : ""),
                          COMPONENT);
    }

    metrics.incrementTransfersCompleted();
    Logger::instance().info("Sent " + std::to_string(data.size()) + " byte(s) in " +
                            std::to_string(chunks->size()) + " chunk(s) to " + descriptor_.channel, COMPONENT);
    return Ok();
}

VoidResult TransferSession::appendDecoded(const Chunk& chunk, ReceiveResult& out, SHA256& digest) {
    auto plain = ChunkCodec::decode(chunk, descriptor_.key.get());
    if (!plain) {
        return plain.error();
    }
    try {
        digest.update(*plain);
    } catch (const std::exception& e) {
        return Err(ErrorCode::InternalError, e.what());
    }
    out.data.insert(out.data.end(), plain->begin(), plain->end());
    return Ok();
}

ReceiveResult TransferSession::receive() {
    SCOPED_TIMER_COMP("receive " + descriptor_.channel, COMPONENT);
    ReceiveResult out;

    descriptor_.channelId.clear();
    descriptor_.acknowledged.clear();

    try {
        descriptor_.lockToken = Crypto::randomToken();
        SHA256 digest;

        auto lastProgress = SteadyClock::now();
        int idlePolls = 0;
        std::optional<uint64_t> lastSequence;
        uint64_t nextIndex = 0;

        for (;;) {
            if (cancelled_) {
                out.error = Err(ErrorCode::Cancelled, "receive cancelled");
                break;
            }

            HttpRequest request = makeRequest("GET", "c");
            request.headers.set(RelayHeaders::LOCK_TOKEN, descriptor_.lockToken);
            request.headers.set(RelayHeaders::WAIT_MS, std::to_string(options_.pollWait.count()));
            if (!descriptor_.channelId.empty()) {
                request.headers.set(RelayHeaders::CHANNEL_ID, descriptor_.channelId);
            }

            auto exchangeStart = SteadyClock::now();
            auto response = exchangeWithRetry(request, "receive");
            if (!response) {
                out.error = response.error();
                break;
            }

            if (response->status == 204) {
                auto now = SteadyClock::now();
                if (now - lastProgress >= options_.idleTimeout) {
                    out.error = Err(ErrorCode::Timeout, "no data on " + descriptor_.channel + " for " +
                                                        formatMs(options_.idleTimeout));
                    break;
                }
                if (now - exchangeStart < options_.pollWait / 2 && !pause(backoffDelay(idlePolls++))) {
                    out.error = Err(ErrorCode::Cancelled, "receive cancelled");
                    break;
                }
                continue;
            }

            auto chunk = ChunkFrame::parse(response->body);
            if (!chunk) {
                out.error = chunk.error();
                break;
            }

            uint64_t sequence = 0;
            try {
                sequence = std::stoull(response->header(RelayHeaders::SEQUENCE, "0"));
            } catch (const std::exception&) {
                out.error = Err(ErrorCode::FormatError, "malformed sequence header");
                break;
            }
            if (lastSequence && sequence != *lastSequence + 1) {
                out.error = Err(ErrorCode::IntegrityError, "sequence gap: expected " +
                                std::to_string(*lastSequence + 1) + ", got " + std::to_string(sequence));
                break;
            }
            if (chunk->producerIndex != nextIndex) {
                out.error = Err(ErrorCode::IntegrityError, "expected chunk " + std::to_string(nextIndex) +
                                " of the stream, got " + std::to_string(chunk->producerIndex));
                break;
            }
            lastSequence = sequence;
            ++nextIndex;

            if (descriptor_.channelId.empty()) {
                descriptor_.channelId = response->header(RelayHeaders::CHANNEL_ID);
            }

            auto appended = appendDecoded(*chunk, out, digest);
            if (!appended) {
                out.error = appended.error();
                break;
            }
            descriptor_.acknowledged.push_back(chunk->producerIndex);
            lastProgress = SteadyClock::now();
            idlePolls = 0;

            if (chunk->isFinal()) {
                descriptor_.streamChecksum = digest.finish();
                auto verified = ChunkCodec::verifyStreamDigest(*chunk, descriptor_.streamChecksum,
                                                               descriptor_.key.get());
                if (!verified) {
                    out.error = verified.error();
                } else {
                    out.complete = true;
                }
                break;
            }
        }
    } catch (const std::exception& e) {
        out.error = Err(ErrorCode::InternalError, e.what());
    }

    auto& metrics = MetricsCollector::instance();
    if (out.ok()) {
        metrics.incrementTransfersCompleted();
        Logger::instance().info("Received " + std::to_string(out.data.size()) + " byte(s) from " +
                                descriptor_.channel, COMPONENT);
    } else {
        metrics.incrementTransfersFailed();
        Logger::instance().warn("Receive from " + descriptor_.channel + " ended after " +
                                std::to_string(out.data.size()) + " byte(s): " +
                                (out.error ? out.error->toString() : std::string("incomplete")), COMPONENT);
    }
    return out;
}

ReceiveResult TransferSession::peek() {
    ReceiveResult out;
    const auto started = SteadyClock::now();
    int level = 0;

    for (;;) {
        if (cancelled_) {
            out.error = Err(ErrorCode::Cancelled, "peek cancelled");
            return out;
        }

        auto response = exchangeWithRetry(makeRequest("GET", "p"), "peek");
        if (!response) {
            out.error = response.error();
            return out;
        }

        if (response->status == 200 && response->header(RelayHeaders::STREAM_COMPLETE) == "1") {
            auto chunks = ChunkFrame::parseSequence(response->body);
            if (!chunks) {
                out.error = chunks.error();
                return out;
            }

            auto finalIt = std::find_if(chunks->begin(), chunks->end(),
                                        [](const Chunk& c) { return c.isFinal(); });
            if (finalIt == chunks->end()) {
                out.error = Err(ErrorCode::FormatError, "complete snapshot without a final chunk");
                return out;
            }
            std::vector<Chunk> stream(chunks->begin(), finalIt + 1);
            for (size_t i = 0; i < stream.size(); ++i) {
                if (stream[i].producerIndex != i) {
                    out.error = Err(ErrorCode::IntegrityError,
                                    "start of the stream was already consumed by a receiver");
                    return out;
                }
            }

            auto data = ChunkCodec::decodeParallel(stream, descriptor_.key.get(), pool());
            if (!data) {
                out.error = data.error();
                return out;
            }
            try {
                descriptor_.streamChecksum = SHA256::digest(*data);
            } catch (const std::exception& e) {
                out.error = Err(ErrorCode::InternalError, e.what());
                return out;
            }
            auto verified = ChunkCodec::verifyStreamDigest(stream.back(), descriptor_.streamChecksum,
                                                           descriptor_.key.get());
            if (!verified) {
                out.error = verified.error();
                return out;
            }
            out.data = std::move(data.value());
            out.complete = true;
            return out;
        }

        if (SteadyClock::now() - started >= options_.idleTimeout) {
            out.error = Err(ErrorCode::Timeout, "stream on " + descriptor_.channel + " did not complete within " +
                                                formatMs(options_.idleTimeout));
            return out;
        }
        if (!pause(backoffDelay(level++))) {
            out.error = Err(ErrorCode::Cancelled, "peek cancelled");
            return out;
        }
    }
}

VoidResult TransferSession::clear() {
    auto response = exchangeWithRetry(makeRequest("DELETE", "c"), "delete");
    if (!response) {
        return response.error();
    }
    Logger::instance().info("Deleted channel " + descriptor_.channel, COMPONENT);
    return Ok();
}

Result<ChannelInfo> TransferSession::query() {
    auto response = exchangeWithRetry(makeRequest("GET", "q"), "query");
    if (!response) {
        return response.error();
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream body(response->bodyText());
    if (!Json::parseFromStream(builder, body, &root, &errors) || !root.isObject()) {
        return Err(ErrorCode::FormatError, "malformed channel info: " + errors);
    }

    ChannelInfo info;
    info.name = root.get("name", descriptor_.channel).asString();
    info.channelId = root.get("channel_id", "").asString();
    info.chunkCount = static_cast<size_t>(root.get("chunks", 0).asUInt64());
    info.queuedBytes = static_cast<size_t>(root.get("bytes", 0).asUInt64());
    info.established = root.get("established", false).asBool();
    info.passwordProtected = root.get("password_protected", false).asBool();
    info.encrypted = root.get("encrypted", false).asBool();
    info.locked = root.get("locked", false).asBool();
    info.complete = root.get("complete", false).asBool();
    info.ageSec = root.get("age_sec", 0).asInt64();
    info.idleSec = root.get("idle_sec", 0).asInt64();
    info.ttlSec = root.get("ttl_sec", 0).asInt();
    info.nextSequence = root.get("next_sequence", 0).asUInt64();
    info.pushes = root.get("pushes", 0).asUInt64();
    info.pops = root.get("pops", 0).asUInt64();
    return info;
}

} // namespace RelayPipe
