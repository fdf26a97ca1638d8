/*
 * File: include/xplink/config.hpp
 * Project: XPLink
 * Purpose: Client configuration, JSON file and environment overrides
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace xplink
{

struct BeaconConfig
{
    std::string group{"239.255.1.1"};
    uint16_t port{49707};
    std::chrono::milliseconds receive_timeout{3000};
    std::chrono::milliseconds probe_interval{10000};
    unsigned warn_every{10};
    // beacon absence tolerated before an open websocket is dropped
    std::chrono::milliseconds grace{60000};
};

struct ClientConfig
{
    std::string host{"127.0.0.1"};
    uint16_t port{8086};
    std::string api_root{"/api"};
    std::string api_version; // empty: newest advertised
    bool use_rest{false};
    bool use_beacon{false};
    BeaconConfig beacon;

    std::chrono::milliseconds reconnect_interval{10000};
    std::chrono::milliseconds retry_interval{1000};
    unsigned max_open_failures{5};
    unsigned warn_every{20};

    std::chrono::milliseconds receive_timeout_searching{1000};
    std::chrono::milliseconds receive_timeout_steady{5000};
    std::chrono::milliseconds http_timeout{5000};
    std::chrono::milliseconds join_timeout{12000};

    std::chrono::seconds min_reload_interval{10};
    std::size_t history_depth{3};

    std::string min_sim_version{"12.1.4"};
    std::string max_sim_version{"12.2.1"};
};

/// Reads a JSON config file; missing keys keep their defaults. Throws std::runtime_error.
ClientConfig load_config(const std::string &path);

ClientConfig config_from_json(const nlohmann::json &j);
nlohmann::json config_to_json(const ClientConfig &cfg);

/// Applies XPLINK_HOST, XPLINK_PORT, XPLINK_API_VERSION, XPLINK_USE_REST, XPLINK_USE_BEACON.
void apply_env(ClientConfig &cfg);

} // namespace xplink
