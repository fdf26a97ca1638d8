/*
 * File: include/xplink/client.hpp
 * Project: XPLink
 * Purpose: Application facade over beacon, REST and WebSocket
 * Notes:
 *  - owns the three loops: beacon monitor, connection monitor, websocket listener
 *  - on open: select api version, reload metadata (forced), rebuild ids,
 *    start the listener, resubscribe; strictly in that order
 *  - disconnect(): stop loops, close sockets, invalidate metadata, clear wire marks
 *  - handles hold a weak reference to the client; it expires first thing in ~Client(),
 *    so handles must not be in use on other threads while the client is destroyed
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "xplink/beacon_monitor.hpp"
#include "xplink/config.hpp"
#include "xplink/connection_monitor.hpp"
#include "xplink/dispatcher.hpp"
#include "xplink/entities.hpp"
#include "xplink/event_bus.hpp"
#include "xplink/listener.hpp"
#include "xplink/metadata_cache.hpp"
#include "xplink/rest_api.hpp"
#include "xplink/subscription_manager.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

class Client : private EntityBackend
{
public:
    explicit Client(ClientConfig cfg = ClientConfig());

    // Transports supplied by the caller; `beacon` may be null when use_beacon is off.
    Client(ClientConfig cfg, std::unique_ptr<HttpClient> http, std::unique_ptr<WsChannel> ws,
           std::unique_ptr<BeaconSocket> beacon);

    ~Client() override;

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    /// Starts discovery (if enabled) and the connection monitor.
    /// @throws TransportError only if the beacon socket cannot be opened
    void connect();
    void disconnect();

    // True once the websocket is open and subscriptions are replayed.
    bool wait_connection(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    bool connected() const { return monitor_.connected(); }

    std::shared_ptr<Dataref> dataref(const std::string &path, bool auto_save = false);
    std::shared_ptr<Command> command(const std::string &path, double duration = 0.0);

    void monitor(Dataref &d) { d.monitor(); }
    bool unmonitor(Dataref &d) { return d.unmonitor(); }
    // One bulk request for the whole batch.
    void monitor(const std::vector<std::shared_ptr<Dataref>> &refs);
    void unmonitor(const std::vector<std::shared_ptr<Dataref>> &refs);
    void monitor(Command &c) { c.monitor(); }
    bool unmonitor(Command &c) { return c.unmonitor(); }

    MetadataCache::ReloadResult reload_cache(bool force = false);
    std::optional<double> uptime() { return rest_.uptime(); }

    EventBus &events() { return events_; }
    ConnectionState state() const { return monitor_.state(); }
    const ClientConfig &config() const { return cfg_; }

    MetadataCache &cache() { return cache_; }
    RestApi &rest() { return rest_; }
    SubscriptionManager &subscriptions() { return subs_; }
    Dispatcher &dispatcher() { return dispatcher_; }
    ConnectionMonitor &connection() { return monitor_; }
    Listener &listener() { return listener_; }
    BeaconMonitor *beacon() { return beacon_.get(); }

private:
    // EntityBackend
    std::shared_ptr<const DatarefMeta> dataref_meta(const std::string &path) override;
    std::shared_ptr<const CommandMeta> command_meta(const std::string &path) override;
    uint64_t metadata_epoch() const override { return cache_.epoch(); }
    std::optional<Value> monitored_value(const DatarefKey &key) override { return subs_.last_value(key); }
    nlohmann::json fetch_value(const DatarefMeta &meta) override;
    void write_value(const DatarefMeta &meta, std::optional<int> index, const nlohmann::json &value) override;
    void execute_command(const CommandMeta &meta, double duration) override;
    void monitor_datarefs(const std::vector<DatarefKey> &keys, bool on) override;
    void monitor_command(const std::string &path, bool on) override;

    std::string select_api_version();
    void on_open();
    void on_close();
    void on_beacon(bool detected, const std::optional<BeaconData> &data, bool same_host);
    bool websocket_writes() const;

    ClientConfig cfg_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<WsChannel> ws_;
    std::unique_ptr<BeaconSocket> beacon_socket_;

    EventBus events_;
    MetadataCache cache_;
    RestApi rest_;
    Dispatcher dispatcher_;
    SubscriptionManager subs_;
    ConnectionMonitor monitor_;
    Listener listener_;
    std::unique_ptr<BeaconMonitor> beacon_;

    // non-owning; only its weak references are handed out
    std::shared_ptr<EntityBackend> self_;
};

} // namespace xplink
