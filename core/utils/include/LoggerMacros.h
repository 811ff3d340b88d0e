/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Example:
 *   LOG_DEBUG_IF("Queued chunk " + std::to_string(seq));  // string built only when debug is on
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <string>

namespace RelayPipe {

#define LOG_DEBUG_IF(msg) \
    do { \
        auto& logger__ = ::RelayPipe::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::RelayPipe::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_IF(msg) \
    do { \
        auto& logger__ = ::RelayPipe::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::RelayPipe::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN(msg) ::RelayPipe::Logger::instance().warn(msg)
#define LOG_ERROR(msg) ::RelayPipe::Logger::instance().error(msg)
#define LOG_CRITICAL(msg) ::RelayPipe::Logger::instance().critical(msg)

#define LOG_WARN_COMP(msg, component) ::RelayPipe::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::RelayPipe::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::RelayPipe::Logger::instance().critical(msg, component)

// Logs elapsed time at debug level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER(name) ::RelayPipe::ScopedTimer timer__(name)
#define SCOPED_TIMER_COMP(name, component) ::RelayPipe::ScopedTimer timer__(name, component)

} // namespace RelayPipe
