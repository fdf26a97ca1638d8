/*
 * File: src/client.cpp
 * Project: XPLink
 * Purpose: Application facade over beacon, REST and WebSocket
 * Last updated: 2026-10-19
 */

#include "xplink/client.hpp"
#include "xplink/beast_transport.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"
#include "xplink/ws_frames.hpp"

namespace xplink
{

Client::Client(ClientConfig cfg)
    : Client(cfg, std::make_unique<BeastHttpClient>(cfg.http_timeout), std::make_unique<BeastWsChannel>(cfg.http_timeout),
             cfg.use_beacon ? std::make_unique<UdpBeaconSocket>() : nullptr)
{
}

Client::Client(ClientConfig cfg, std::unique_ptr<HttpClient> http, std::unique_ptr<WsChannel> ws,
               std::unique_ptr<BeaconSocket> beacon)
    : cfg_(std::move(cfg)), http_(std::move(http)), ws_(std::move(ws)), beacon_socket_(std::move(beacon)),
      cache_(cfg_.min_reload_interval), rest_(*http_, cfg_), dispatcher_(events_, cache_),
      subs_(cache_, dispatcher_, cfg_.history_depth),
      monitor_(cfg_, rest_, *ws_, events_,
               ConnectionMonitor::Hooks{[this]
                                        { return select_api_version(); },
                                        [this]
                                        { on_open(); },
                                        [this]
                                        { on_close(); },
                                        [this]
                                        { cache_.invalidate(); }}),
      listener_(cfg_, *ws_, dispatcher_, subs_, monitor_)
{
    Logger::initialize();
    self_ = std::shared_ptr<EntityBackend>(static_cast<EntityBackend *>(this), [](EntityBackend *) {});
    if (cfg_.use_beacon)
    {
        if (!beacon_socket_)
            throw ContractError("beacon discovery enabled without a beacon socket");
        beacon_ = std::make_unique<BeaconMonitor>(cfg_.beacon, *beacon_socket_);
        beacon_->set_callback([this](bool detected, const std::optional<BeaconData> &data, bool same_host)
                              { on_beacon(detected, data, same_host); });
    }
}

Client::~Client()
{
    self_.reset();
    disconnect();
}

void Client::connect()
{
    XPLINK_LOG_INFO("connecting to {}:{}{}", rest_.host(), rest_.port(), cfg_.use_beacon ? " (beacon discovery)" : "");
    if (beacon_)
        beacon_->start();
    monitor_.start();
}

void Client::disconnect()
{
    if (!monitor_.running() && !listener_.running() && !(beacon_ && beacon_->state() != BeaconMonitor::State::NotRunning) &&
        !ws_->is_open())
        return;

    XPLINK_LOG_DEBUG("disconnecting..");
    monitor_.stop();
    if (beacon_)
        beacon_->stop();
    listener_.stop();

    dispatcher_.attach(nullptr);
    const bool was_open = ws_->is_open() || monitor_.connected();
    ws_->close();
    monitor_.reset();
    if (beacon_socket_)
        beacon_socket_->close();

    cache_.invalidate();
    subs_.clear_wire_state();
    if (was_open)
    {
        monitor_.set_state(ConnectionState::WsDisconnected);
        events_.close.emit();
    }
    XPLINK_LOG_INFO("..disconnected");
}

bool Client::wait_connection(std::chrono::milliseconds timeout)
{
    return monitor_.wait_connection(timeout);
}

std::shared_ptr<Dataref> Client::dataref(const std::string &path, bool auto_save)
{
    return std::make_shared<Dataref>(self_, path, auto_save);
}

std::shared_ptr<Command> Client::command(const std::string &path, double duration)
{
    return std::make_shared<Command>(self_, path, duration);
}

void Client::monitor(const std::vector<std::shared_ptr<Dataref>> &refs)
{
    std::vector<DatarefKey> keys;
    keys.reserve(refs.size());
    for (const auto &d : refs)
    {
        d->inc_monitor();
        keys.push_back(d->key());
    }
    subs_.subscribe(keys);
}

void Client::unmonitor(const std::vector<std::shared_ptr<Dataref>> &refs)
{
    std::vector<DatarefKey> keys;
    for (const auto &d : refs)
        if (d->dec_monitor())
            keys.push_back(d->key());
    if (!keys.empty())
        subs_.unsubscribe(keys);
}

MetadataCache::ReloadResult Client::reload_cache(bool force)
{
    auto r = cache_.reload(rest_, force);
    if (r == MetadataCache::ReloadResult::Reloaded)
        subs_.rebuild();
    return r;
}

std::string Client::select_api_version()
{
    rest_.set_api_version(cfg_.api_version);
    return rest_.versioned_root();
}

void Client::on_open()
{
    select_api_version();
    if (cache_.reload(rest_, true) == MetadataCache::ReloadResult::Failed)
        throw TransportError("metadata could not be loaded");
    subs_.rebuild();
    dispatcher_.attach(ws_.get());
    listener_.start();
    subs_.resubscribe_all();
}

void Client::on_close()
{
    dispatcher_.attach(nullptr);
    listener_.stop();
    subs_.clear_wire_state();
}

void Client::on_beacon(bool detected, const std::optional<BeaconData> &data, bool same_host)
{
    if (detected && data)
    {
        const std::string host = same_host ? std::string("127.0.0.1") : data->host;
        if (host != rest_.host())
        {
            XPLINK_LOG_INFO("simulator at {} ({})", host, data->hostname);
            rest_.set_endpoint(host, rest_.port());
        }
        monitor_.beacon_found();
        return;
    }
    XPLINK_LOG_DEBUG("beacon not detected, will stop in {} secs.",
                     std::chrono::duration_cast<std::chrono::seconds>(cfg_.beacon.grace).count());
    monitor_.beacon_lost();
}

bool Client::websocket_writes() const
{
    return !cfg_.use_rest && dispatcher_.attached();
}

std::shared_ptr<const DatarefMeta> Client::dataref_meta(const std::string &path)
{
    if (auto m = cache_.dataref(path))
        return m;
    try
    {
        if (auto m = rest_.dataref_meta_by_name(path))
            return std::make_shared<const DatarefMeta>(std::move(*m));
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_DEBUG("dataref {} lookup: {}", path, e.what());
        throw NotConnected();
    }
    throw UnknownPath(path);
}

std::shared_ptr<const CommandMeta> Client::command_meta(const std::string &path)
{
    if (auto m = cache_.command(path))
        return m;
    try
    {
        if (auto m = rest_.command_meta_by_name(path))
            return std::make_shared<const CommandMeta>(std::move(*m));
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_DEBUG("command {} lookup: {}", path, e.what());
        throw NotConnected();
    }
    throw UnknownPath(path);
}

nlohmann::json Client::fetch_value(const DatarefMeta &meta)
{
    return rest_.dataref_value(meta.id);
}

void Client::write_value(const DatarefMeta &meta, std::optional<int> index, const nlohmann::json &value)
{
    if (cfg_.use_rest)
    {
        rest_.write_dataref_value(meta.id, value, index);
        return;
    }
    if (!websocket_writes() || !dispatcher_.send(dataref_set_frame(meta.id, value, index)))
        throw NotConnected();
}

void Client::execute_command(const CommandMeta &meta, double duration)
{
    if (cfg_.use_rest)
    {
        rest_.activate_command(meta.id, duration);
        return;
    }
    if (!websocket_writes() || !dispatcher_.send(command_set_active_frame(meta.id, true, duration)))
        throw NotConnected();
}

void Client::monitor_datarefs(const std::vector<DatarefKey> &keys, bool on)
{
    if (on)
        subs_.subscribe(keys);
    else
        subs_.unsubscribe(keys);
}

void Client::monitor_command(const std::string &path, bool on)
{
    if (on)
        subs_.subscribe_command(path);
    else
        subs_.unsubscribe_command(path);
}

} // namespace xplink
