/*
 * File: include/xplink/connection_monitor.hpp
 * Project: XPLink
 * Purpose: REST probe / WebSocket open / reconnect state machine
 * Notes:
 *  - step() is one pass of the loop; the loop thread calls it and waits the returned delay
 *  - open failures are counted; after max_open_failures the monitor pauses for
 *    reconnect_interval, then a reachable REST probe (or restart()) starts a new cycle
 *  - RestUnreachable is only entered once REST has been reachable at least once
 *  - with beacon discovery on, nothing is probed until a beacon has been seen;
 *    a beacon lost for longer than beacon.grace drops an open connection
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "xplink/config.hpp"
#include "xplink/connection_state.hpp"
#include "xplink/event_bus.hpp"
#include "xplink/logger.hpp"
#include "xplink/loop_thread.hpp"
#include "xplink/rest_api.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

class ConnectionMonitor
{
public:
    struct Hooks
    {
        // WebSocket target path, e.g. "/api/v2"; may select the API version
        std::function<std::string()> target;
        // runs after the socket is open, before "open" fires
        std::function<void()> on_open;
        // runs after a drop, before "close" fires
        std::function<void()> on_close;
        // beacon gone for longer than the grace period
        std::function<void()> on_beacon_expired;
    };

    using Clock = std::chrono::steady_clock;

    ConnectionMonitor(const ClientConfig &cfg, RestApi &rest, WsChannel &ws, EventBus &events, Hooks hooks);
    ~ConnectionMonitor();

    void start();
    void stop();
    bool running() const { return loop_.running(); }

    std::chrono::milliseconds step();

    // Beacon detected again: forget earlier open failures and probe now.
    void restart();

    // Forget the connection without firing events; the loop must be stopped.
    void reset();

    // Receive loop saw the socket close.
    void notify_dropped();

    void beacon_found();
    void beacon_lost(Clock::time_point when = Clock::now());

    bool wait_connection(std::chrono::milliseconds timeout);

    ConnectionState state() const;
    void set_state(ConnectionState s);

    bool connected() const { return connected_.load(); }
    bool rest_reachable() const { return rest_reachable_.load(); }
    unsigned open_failures() const { return open_failures_.load(); }
    bool given_up() const { return given_up_.load(); }

private:
    void drop(const char *why);
    void check_simulator_version();

    const ClientConfig &cfg_;
    RestApi &rest_;
    WsChannel &ws_;
    EventBus &events_;
    Hooks hooks_;
    WarnLimiter open_warn_;
    LoopThread loop_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> rest_reachable_{false};
    std::atomic<bool> ever_reachable_{false};
    std::atomic<bool> dropped_{false};
    std::atomic<bool> given_up_{false};
    std::atomic<unsigned> open_failures_{0};

    mutable std::mutex m_;
    std::condition_variable cv_;
    ConnectionState state_{ConnectionState::NoBeacon};
    bool beacon_present_;
    std::optional<Clock::time_point> beacon_lost_at_;
};

} // namespace xplink
