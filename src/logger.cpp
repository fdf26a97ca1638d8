/*
 * File: src/logger.cpp
 * Project: XPLink
 * Purpose: Logger set-up from environment variables
 * Last updated: 2026-10-19
 */

#include "xplink/logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace xplink
{

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::shared_ptr<spdlog::logger> Logger::s_traffic = nullptr;
std::atomic<bool> Logger::s_initialized{false};

namespace
{

std::string env_or_empty(const char *name)
{
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

int parse_level(std::string level)
{
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (level == "trace")
        return SPDLOG_LEVEL_TRACE;
    if (level == "debug")
        return SPDLOG_LEVEL_DEBUG;
    if (level == "info")
        return SPDLOG_LEVEL_INFO;
    if (level == "warn" || level == "warning")
        return SPDLOG_LEVEL_WARN;
    if (level == "error")
        return SPDLOG_LEVEL_ERROR;
    return -1;
}

} // namespace

int Logger::level_from_env()
{
    int lvl = parse_level(env_or_empty("XPLINK_LOG_LEVEL"));
    return lvl < 0 ? SPDLOG_LEVEL_INFO : lvl;
}

bool Logger::initialize()
{
    if (s_initialized)
        return true;

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        const std::string file = env_or_empty("XPLINK_LOG_FILE");
        if (!file.empty())
        {
            // 5 MB per file, 3 files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 5 * 1024 * 1024, 3));
        }

        s_logger = std::make_shared<spdlog::logger>("xplink", sinks.begin(), sinks.end());
        s_logger->set_pattern("[%H:%M:%S.%e] %^%l%$ [%t] %v");
        s_logger->set_level(static_cast<spdlog::level::level_enum>(level_from_env()));
        s_logger->flush_on(spdlog::level::warn);

        const std::string traffic = env_or_empty("XPLINK_TRAFFIC_LOG");
        if (!traffic.empty())
        {
            s_traffic = std::make_shared<spdlog::logger>(
                "xplink-traffic", std::make_shared<spdlog::sinks::basic_file_sink_mt>(traffic, true));
            s_traffic->set_pattern("\"%Y-%m-%d %H:%M:%S.%e\" %v");
            s_traffic->set_level(spdlog::level::info);
        }

        s_initialized = true;
        s_logger->debug("logger initialized (level {})", spdlog::level::to_string_view(s_logger->level()));
        return true;
    }
    catch (const spdlog::spdlog_ex &e)
    {
        std::cerr << "xplink: logger init failed: " << e.what() << "\n";
        s_logger.reset();
        s_traffic.reset();
        return false;
    }
}

void Logger::shutdown()
{
    if (!s_initialized)
        return;
    flush();
    s_initialized = false;
    s_logger.reset();
    s_traffic.reset();
}

std::shared_ptr<spdlog::logger> Logger::get() { return s_logger; }

std::shared_ptr<spdlog::logger> Logger::traffic() { return s_initialized ? s_traffic : nullptr; }

void Logger::flush()
{
    if (s_logger)
        s_logger->flush();
    if (s_traffic)
        s_traffic->flush();
}

bool Logger::is_initialized() { return s_initialized; }

void Logger::set_level(const std::string &level)
{
    int lvl = parse_level(level);
    if (lvl >= 0 && s_logger)
        s_logger->set_level(static_cast<spdlog::level::level_enum>(lvl));
}

} // namespace xplink
