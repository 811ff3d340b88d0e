#pragma once

/**
 * @file SocketGuard.h
 * @brief RAII owner for socket file descriptors
 *
 * Used by the relay server for accepted connections and by HttpClient for
 * outbound ones so that every early return closes the descriptor.
 */

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace RelayPipe {

class SocketGuard {
public:
    SocketGuard() noexcept : fd_(-1) {}
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() {
        reset();
    }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
    bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Apply the same send and receive timeout; 0 disables the timeout
    bool setTimeouts(int timeoutMs) const noexcept {
        if (fd_ < 0) return false;
        struct timeval tv;
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        return setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
               setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    /// Wake up any thread blocked on this socket without closing it
    void shutdownBoth() const noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_;
};

} // namespace RelayPipe
