/*
 * File: src/rest_api.cpp
 * Project: XPLink
 * Purpose: Simulator REST API: reachability, capabilities, metadata and values
 * Last updated: 2026-10-19
 */

#include "xplink/rest_api.hpp"
#include "xplink/errors.hpp"
#include "xplink/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace xplink
{

using nlohmann::json;

const json &v1_capabilities()
{
    static const json caps = json::parse(R"({"api":{"versions":["v1"]},"x-plane":{"version":"12.1.1"}})");
    return caps;
}

std::string url_encode(const std::string &s)
{
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

RestApi::RestApi(HttpClient &http, const ClientConfig &cfg)
    : http_(http), api_root_(cfg.api_root), unreachable_warn_(cfg.warn_every), host_(cfg.host), port_(cfg.port)
{
}

void RestApi::set_endpoint(const std::string &host, uint16_t port)
{
    {
        std::scoped_lock lk(m_);
        host_ = host;
        port_ = port;
    }
    reset_connection();
}

std::string RestApi::host() const
{
    std::scoped_lock lk(m_);
    return host_;
}

uint16_t RestApi::port() const
{
    std::scoped_lock lk(m_);
    return port_;
}

void RestApi::reset_connection()
{
    std::scoped_lock lk(m_);
    capabilities_.reset();
    uptime_id_.reset();
}

HttpResponse RestApi::call(const std::string &verb, const std::string &target, const std::string &body)
{
    HttpRequest req;
    {
        std::scoped_lock lk(m_);
        req.host = host_;
        req.port = port_;
    }
    req.verb = verb;
    req.target = target;
    req.body = body;
    HttpResponse res = http_.request(req);
    if (body.empty())
        XPLINK_TRAFFIC("{} {} -> {}", verb, target, res.status);
    else
        XPLINK_TRAFFIC("{} {} {} -> {}", verb, target, body, res.status);
    return res;
}

json RestApi::call_json(const std::string &verb, const std::string &target, const std::string &body)
{
    HttpResponse res = call(verb, target, body);
    if (res.status != 200)
        throw TransportError(verb + " " + target + ": status " + std::to_string(res.status) + " " + res.body);
    json j = json::parse(res.body, nullptr, false);
    if (j.is_discarded())
        throw TransportError(verb + " " + target + ": invalid JSON response");
    return j;
}

bool RestApi::reachable()
{
    try
    {
        HttpResponse res = call("GET", api_root_ + "/v1/datarefs/count");
        if (res.status == 200)
        {
            unreachable_warn_.reset();
            return true;
        }
        if (unreachable_warn_.allow())
            XPLINK_LOG_WARN("rest api answered {} at {}:{}", res.status, host(), port());
    }
    catch (const TransportError &e)
    {
        if (unreachable_warn_.allow())
            XPLINK_LOG_WARN("rest api unreachable ({} attempts): {}", unreachable_warn_.count(), e.what());
    }
    return false;
}

json RestApi::capabilities()
{
    {
        std::scoped_lock lk(m_);
        if (capabilities_)
            return *capabilities_;
    }

    json caps;
    try
    {
        HttpResponse res = call("GET", api_root_ + "/capabilities");
        json j = res.status == 200 ? json::parse(res.body, nullptr, false) : json();
        if (j.is_object())
        {
            caps = std::move(j);
            XPLINK_LOG_DEBUG("capabilities: {}", caps.dump());
        }
        else
        {
            XPLINK_LOG_INFO("no capabilities (status {}), assuming v1", res.status);
            caps = v1_capabilities();
        }
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_WARN("capabilities: {}, assuming v1", e.what());
        caps = v1_capabilities();
    }

    std::scoped_lock lk(m_);
    capabilities_ = caps;
    return caps;
}

std::string RestApi::set_api_version(const std::string &requested)
{
    json caps = capabilities();
    std::vector<std::string> versions;
    auto api = caps.find("api");
    if (api != caps.end() && api->is_object())
    {
        auto v = api->find("versions");
        if (v != api->end() && v->is_array())
            for (const auto &e : *v)
                if (e.is_string())
                    versions.push_back(e.get<std::string>());
    }

    std::string selected;
    if (versions.empty())
    {
        selected = requested.empty() ? "v1" : requested;
        XPLINK_LOG_WARN("no api versions in capabilities, using {} unchecked", selected);
    }
    else if (!requested.empty() && std::find(versions.begin(), versions.end(), requested) != versions.end())
    {
        selected = requested;
    }
    else
    {
        selected = newest_version(versions);
        if (!requested.empty())
            XPLINK_LOG_WARN("no api {} advertised, using {}", requested, selected);
    }

    {
        std::scoped_lock lk(m_);
        if (api_version_ != selected)
            uptime_id_.reset();
        api_version_ = selected;
    }
    XPLINK_LOG_INFO("api {} selected, simulator {}", selected, simulator_version().value_or("unknown"));
    return selected;
}

std::string RestApi::api_version() const
{
    std::scoped_lock lk(m_);
    return api_version_;
}

std::optional<std::string> RestApi::simulator_version()
{
    json caps = capabilities();
    auto xp = caps.find("x-plane");
    if (xp == caps.end() || !xp->is_object())
        return std::nullopt;
    auto v = xp->find("version");
    if (v == xp->end() || !v->is_string())
        return std::nullopt;
    return v->get<std::string>();
}

std::string RestApi::versioned_root() const
{
    return api_root_ + "/" + api_version();
}

json RestApi::find_by_name(const std::string &collection, const std::string &path)
{
    const std::string target = versioned_root() + collection + "?filter%5Bname%5D=" + url_encode(path);
    HttpResponse res = call("GET", target);
    // the server answers 4xx for names it does not know
    if (res.status != 200)
        return json::object();
    json j = json::parse(res.body, nullptr, false);
    if (j.is_discarded())
        throw TransportError("GET " + target + ": invalid JSON response");
    return j;
}

std::optional<DatarefMeta> RestApi::dataref_meta_by_name(const std::string &path)
{
    json j = find_by_name("/datarefs", path);
    auto data = j.find("data");
    if (data == j.end() || !data->is_array() || data->empty())
        return std::nullopt;
    return dataref_meta_from_json(data->front());
}

std::optional<CommandMeta> RestApi::command_meta_by_name(const std::string &path)
{
    json j = find_by_name("/commands", path);
    auto data = j.find("data");
    if (data == j.end() || !data->is_array() || data->empty())
        return std::nullopt;
    return command_meta_from_json(data->front());
}

json RestApi::dataref_value(int64_t id)
{
    json j = call_json("GET", versioned_root() + "/datarefs/" + std::to_string(id) + "/value");
    auto data = j.find("data");
    if (data == j.end())
        throw TransportError("dataref " + std::to_string(id) + " value response without data");
    return *data;
}

void RestApi::write_dataref_value(int64_t id, const json &value, std::optional<int> index)
{
    std::string target = versioned_root() + "/datarefs/" + std::to_string(id) + "/value";
    if (index)
        target += "?index=" + std::to_string(*index);
    HttpResponse res = call("PATCH", target, json{{"data", value}}.dump());
    if (res.status != 200)
        throw TransportError("PATCH " + target + ": status " + std::to_string(res.status) + " " + res.body);
}

void RestApi::activate_command(int64_t id, double duration)
{
    std::string target = versioned_root() + "/command/" + std::to_string(id) + "/activate";
    HttpResponse res = call("POST", target, json{{"id", id}, {"duration", duration}}.dump());
    if (res.status != 200)
        throw TransportError("POST " + target + ": status " + std::to_string(res.status) + " " + res.body);
}

json RestApi::fetch_datarefs()
{
    json j = call_json("GET", versioned_root() + "/datarefs");
    auto data = j.find("data");
    if (data == j.end() || !data->is_array())
        throw TransportError("datarefs response without data array");
    return *data;
}

json RestApi::fetch_commands()
{
    json j = call_json("GET", versioned_root() + "/commands");
    auto data = j.find("data");
    if (data == j.end() || !data->is_array())
        throw TransportError("commands response without data array");
    return *data;
}

bool RestApi::supports_commands() const
{
    return natural_compare(api_version(), "v2") >= 0;
}

std::optional<double> RestApi::uptime()
{
    try
    {
        std::optional<int64_t> id;
        {
            std::scoped_lock lk(m_);
            id = uptime_id_;
        }
        if (!id)
        {
            auto meta = dataref_meta_by_name(kUptimeDataref);
            if (!meta)
                return std::nullopt;
            id = meta->id;
            std::scoped_lock lk(m_);
            uptime_id_ = id;
        }
        json v = dataref_value(*id);
        if (!v.is_number())
            return std::nullopt;
        return v.get<double>();
    }
    catch (const Error &e)
    {
        XPLINK_LOG_DEBUG("uptime unavailable: {}", e.what());
        return std::nullopt;
    }
}

} // namespace xplink
