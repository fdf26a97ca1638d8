/*
 * File: src/config.cpp
 * Project: XPLink
 * Purpose: Client configuration loading
 * Last updated: 2026-10-19
 */

#include "xplink/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace xplink
{

namespace
{

template <typename Duration>
void read_ms(const nlohmann::json &j, const char *key, Duration &out)
{
    if (j.contains(key))
        out = std::chrono::duration_cast<Duration>(std::chrono::milliseconds(j.at(key).get<int64_t>()));
}

bool truthy(const std::string &v)
{
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

ClientConfig config_from_json(const nlohmann::json &j)
{
    ClientConfig cfg;
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.api_root = j.value("api_root", cfg.api_root);
    cfg.api_version = j.value("api_version", cfg.api_version);
    cfg.use_rest = j.value("use_rest", cfg.use_rest);
    cfg.use_beacon = j.value("use_beacon", cfg.use_beacon);

    if (j.contains("beacon"))
    {
        const auto &b = j.at("beacon");
        cfg.beacon.group = b.value("group", cfg.beacon.group);
        cfg.beacon.port = b.value("port", cfg.beacon.port);
        cfg.beacon.warn_every = b.value("warn_every", cfg.beacon.warn_every);
        read_ms(b, "receive_timeout_ms", cfg.beacon.receive_timeout);
        read_ms(b, "probe_interval_ms", cfg.beacon.probe_interval);
        read_ms(b, "grace_ms", cfg.beacon.grace);
    }

    read_ms(j, "reconnect_interval_ms", cfg.reconnect_interval);
    read_ms(j, "retry_interval_ms", cfg.retry_interval);
    read_ms(j, "receive_timeout_searching_ms", cfg.receive_timeout_searching);
    read_ms(j, "receive_timeout_steady_ms", cfg.receive_timeout_steady);
    read_ms(j, "http_timeout_ms", cfg.http_timeout);
    read_ms(j, "join_timeout_ms", cfg.join_timeout);
    cfg.max_open_failures = j.value("max_open_failures", cfg.max_open_failures);
    cfg.warn_every = j.value("warn_every", cfg.warn_every);
    if (j.contains("min_reload_interval_s"))
        cfg.min_reload_interval = std::chrono::seconds(j.at("min_reload_interval_s").get<int64_t>());
    cfg.history_depth = j.value("history_depth", cfg.history_depth);
    cfg.min_sim_version = j.value("min_sim_version", cfg.min_sim_version);
    cfg.max_sim_version = j.value("max_sim_version", cfg.max_sim_version);
    return cfg;
}

nlohmann::json config_to_json(const ClientConfig &cfg)
{
    return nlohmann::json{
        {"host", cfg.host},
        {"port", cfg.port},
        {"api_root", cfg.api_root},
        {"api_version", cfg.api_version},
        {"use_rest", cfg.use_rest},
        {"use_beacon", cfg.use_beacon},
        {"beacon", {{"group", cfg.beacon.group},
                    {"port", cfg.beacon.port},
                    {"receive_timeout_ms", cfg.beacon.receive_timeout.count()},
                    {"probe_interval_ms", cfg.beacon.probe_interval.count()},
                    {"warn_every", cfg.beacon.warn_every},
                    {"grace_ms", cfg.beacon.grace.count()}}},
        {"reconnect_interval_ms", cfg.reconnect_interval.count()},
        {"retry_interval_ms", cfg.retry_interval.count()},
        {"max_open_failures", cfg.max_open_failures},
        {"warn_every", cfg.warn_every},
        {"receive_timeout_searching_ms", cfg.receive_timeout_searching.count()},
        {"receive_timeout_steady_ms", cfg.receive_timeout_steady.count()},
        {"http_timeout_ms", cfg.http_timeout.count()},
        {"join_timeout_ms", cfg.join_timeout.count()},
        {"min_reload_interval_s", cfg.min_reload_interval.count()},
        {"history_depth", cfg.history_depth},
        {"min_sim_version", cfg.min_sim_version},
        {"max_sim_version", cfg.max_sim_version}};
}

ClientConfig load_config(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("open config failed: " + path);
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw std::runtime_error("config is not a JSON object: " + path);
    return config_from_json(j);
}

void apply_env(ClientConfig &cfg)
{
    if (const char *v = std::getenv("XPLINK_HOST"))
        cfg.host = v;
    if (const char *v = std::getenv("XPLINK_PORT"))
    {
        try
        {
            cfg.port = static_cast<uint16_t>(std::stoul(v));
        }
        catch (const std::exception &)
        {
            throw std::runtime_error(std::string("XPLINK_PORT is not a port number: ") + v);
        }
    }
    if (const char *v = std::getenv("XPLINK_API_VERSION"))
        cfg.api_version = v;
    if (const char *v = std::getenv("XPLINK_USE_REST"))
        cfg.use_rest = truthy(v);
    if (const char *v = std::getenv("XPLINK_USE_BEACON"))
        cfg.use_beacon = truthy(v);
}

} // namespace xplink
