#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for RelayPipe
 *
 * Defaults here can be overridden from the server or client config file.
 */

#include <cstddef>
#include <cstdint>

namespace RelayPipe::config {

// =============================================================================
// Chunking
// =============================================================================

/// Largest plaintext piece carried by one chunk (bytes)
constexpr std::size_t MAX_CHUNK_PLAINTEXT = 4 * 1024 * 1024;  // 4MB

/// Largest request body the server accepts for a single chunk frame
constexpr std::size_t MAX_FRAME_SIZE = MAX_CHUNK_PLAINTEXT + 64 * 1024;

/// Largest body accepted on the plaintext web path
constexpr std::size_t MAX_WEB_BODY = MAX_CHUNK_PLAINTEXT;

/// PBKDF2 iterations for the channel encryption key
constexpr int KDF_ITERATIONS = 100000;

// =============================================================================
// Channel lifetime
// =============================================================================

/// Time-to-live of an idle channel (seconds)
constexpr int DEFAULT_TTL_SEC = 300;

/// Upper bound for a writer-requested TTL (seconds)
constexpr int MAX_TTL_SEC = 24 * 60 * 60;

/// A receiver lock with no activity for this long is released (milliseconds)
constexpr int LOCK_IDLE_TIMEOUT_MS = 30000;

/// Upper bound on bytes queued in one channel
constexpr std::size_t MAX_CHANNEL_BYTES = 256 * 1024 * 1024;  // 256MB

/// Longest channel name accepted
constexpr std::size_t MAX_CHANNEL_NAME = 256;

/// Expiry sweeper period (milliseconds)
constexpr int SWEEP_INTERVAL_MS = 5000;

// =============================================================================
// Server
// =============================================================================

/// Default relay port
constexpr int DEFAULT_PORT = 8080;

/// TCP server backlog size
constexpr int TCP_BACKLOG = 64;

/// Longest long-poll a RECEIVE may request (milliseconds)
constexpr int MAX_WAIT_MS = 30000;

/// Per-client request rate (requests per second, 0 = unlimited)
constexpr std::size_t DEFAULT_RATE_LIMIT_RPS = 0;

/// Largest accepted request head (request line + headers)
constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

/// Socket read/write timeout for server connections (milliseconds)
constexpr int SERVER_IO_TIMEOUT_MS = 60000;

// =============================================================================
// Client
// =============================================================================

/// Default per-exchange timeout (milliseconds)
constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 60000;

/// Receiver gives up after this long without a new chunk (milliseconds)
constexpr int DEFAULT_IDLE_TIMEOUT_MS = 60000;

/// Long-poll wait requested by receiving sessions (milliseconds)
constexpr int DEFAULT_POLL_WAIT_MS = 10000;

/// Attempts per exchange before a transient error becomes fatal
constexpr int DEFAULT_MAX_RETRIES = 20;

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace RelayPipe::config
