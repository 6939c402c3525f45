/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is disabled
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Chunk " + std::to_string(index) + " sent", "TransferSender");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace PeerBeam {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::PeerBeam::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::PeerBeam::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::PeerBeam::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::PeerBeam::Logger::instance().error(msg, component)

// Logs elapsed time at DEBUG on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(elapsed) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::PeerBeam::ScopedTimer timer__(name, component)

} // namespace PeerBeam
