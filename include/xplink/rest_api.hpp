/*
 * File: include/xplink/rest_api.hpp
 * Project: XPLink
 * Purpose: Simulator REST API: reachability, capabilities, metadata and values
 * Notes:
 *  - capabilities are fetched once per connection; reset_connection() drops them
 *  - /api/capabilities appeared with v2; older servers get the built-in v1 set
 *  - all calls go through HttpClient and are logged to the traffic log
 * Last updated: 2026-10-19
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "xplink/config.hpp"
#include "xplink/logger.hpp"
#include "xplink/metadata_cache.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

// Running time dataref, drives the metadata reload interval.
constexpr const char *kUptimeDataref = "sim/time/total_running_time_sec";

// Served when /api/capabilities is missing.
const nlohmann::json &v1_capabilities();

class RestApi : public MetadataSource
{
public:
    RestApi(HttpClient &http, const ClientConfig &cfg);

    // Changes the target simulator and forgets everything learned from the previous one.
    void set_endpoint(const std::string &host, uint16_t port);
    std::string host() const;
    uint16_t port() const;

    // Forget capabilities and the selected version.
    void reset_connection();

    /// GET /api/v1/datarefs/count answers 200. Never throws.
    bool reachable();

    nlohmann::json capabilities();

    /**
     * Select the API version to talk.
     *
     * Empty `requested` takes the newest advertised version (natural order, so v10 > v2).
     * A requested version the server does not advertise is refused with a warning and the
     * newest is used instead.
     * @return the selected version, e.g. "v2"
     */
    std::string set_api_version(const std::string &requested = "");
    std::string api_version() const;

    // "x-plane"."version" from capabilities
    std::optional<std::string> simulator_version();

    // "/api/v2"
    std::string versioned_root() const;

    /// nullopt when the server does not know the name. @throws TransportError
    std::optional<DatarefMeta> dataref_meta_by_name(const std::string &path);
    std::optional<CommandMeta> command_meta_by_name(const std::string &path);

    /// Raw "data" member of GET /datarefs/{id}/value. @throws TransportError
    nlohmann::json dataref_value(int64_t id);

    /// PATCH /datarefs/{id}/value[?index=n] with {"data": value}. @throws TransportError
    void write_dataref_value(int64_t id, const nlohmann::json &value, std::optional<int> index);

    /// POST /command/{id}/activate. @throws TransportError
    void activate_command(int64_t id, double duration);

    // MetadataSource
    nlohmann::json fetch_datarefs() override;
    nlohmann::json fetch_commands() override;
    bool supports_commands() const override;
    std::optional<double> uptime() override;

private:
    HttpResponse call(const std::string &verb, const std::string &target, const std::string &body = "");
    nlohmann::json call_json(const std::string &verb, const std::string &target, const std::string &body = "");
    nlohmann::json find_by_name(const std::string &collection, const std::string &path);

    HttpClient &http_;
    std::string api_root_;
    WarnLimiter unreachable_warn_;

    mutable std::mutex m_;
    std::string host_;
    uint16_t port_;
    std::optional<nlohmann::json> capabilities_;
    std::string api_version_{"v1"};
    std::optional<int64_t> uptime_id_;
};

std::string url_encode(const std::string &s);

} // namespace xplink
