/*
 * File: include/xplink/logger.hpp
 * Project: XPLink
 * Purpose: spdlog wrapper, log macros and warning rate limiter
 * Notes:
 *  - XPLINK_LOG_LEVEL   : trace|debug|info|warn|error (default info)
 *  - XPLINK_LOG_FILE    : path of a rotating log file (optional)
 *  - XPLINK_TRAFFIC_LOG : path of the wire traffic log (optional)
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace xplink
{

class Logger
{
public:
    /**
     * @brief Set up the runtime logger and, if configured, the traffic logger.
     *
     * Safe to call more than once; later calls are no-ops.
     * @return true if the logger is usable afterwards
     */
    static bool initialize();

    /// Flush and drop both loggers.
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get();

    /// Wire traffic logger, nullptr unless XPLINK_TRAFFIC_LOG is set.
    static std::shared_ptr<spdlog::logger> traffic();

    static void flush();
    static bool is_initialized();

    /// Overrides the level picked from the environment.
    static void set_level(const std::string &level);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static std::shared_ptr<spdlog::logger> s_traffic;
    static std::atomic<bool> s_initialized;

    static int level_from_env();
};

// Lets a repeated warning through once every `every` calls.
class WarnLimiter
{
public:
    explicit WarnLimiter(unsigned every) : every_(every == 0 ? 1 : every) {}

    bool allow() { return count_.fetch_add(1) % every_ == 0; }
    void reset() { count_ = 0; }
    unsigned count() const { return count_.load(); }

private:
    unsigned every_;
    std::atomic<unsigned> count_{0};
};

} // namespace xplink

#define XPLINK_LOG_AT_(lvl, ...)                                          \
    do                                                                    \
    {                                                                     \
        if (::xplink::Logger::is_initialized())                           \
            ::xplink::Logger::get()->lvl(__VA_ARGS__);                    \
    } while (0)

#define XPLINK_LOG_TRACE(...) XPLINK_LOG_AT_(trace, __VA_ARGS__)
#define XPLINK_LOG_DEBUG(...) XPLINK_LOG_AT_(debug, __VA_ARGS__)
#define XPLINK_LOG_INFO(...) XPLINK_LOG_AT_(info, __VA_ARGS__)
#define XPLINK_LOG_WARN(...) XPLINK_LOG_AT_(warn, __VA_ARGS__)
#define XPLINK_LOG_ERROR(...) XPLINK_LOG_AT_(error, __VA_ARGS__)

#define XPLINK_TRAFFIC(...)                                               \
    do                                                                    \
    {                                                                     \
        if (auto xplink_traffic_ = ::xplink::Logger::traffic())           \
            xplink_traffic_->info(__VA_ARGS__);                           \
    } while (0)
