/*
 * File: include/xplink/beacon_monitor.hpp
 * Project: XPLink
 * Purpose: Watches the simulator discovery beacon
 * Notes:
 *  - NotRunning -> Running -> DetectingBeacon -> Running (timeout) -> NotRunning (stop)
 *  - the callback fires on transitions only, and when the beacon contents change
 *  - "no beacon" warnings once every beacon.warn_every failed attempts
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

#include "xplink/beacon_codec.hpp"
#include "xplink/config.hpp"
#include "xplink/logger.hpp"
#include "xplink/loop_thread.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

class BeaconMonitor
{
public:
    enum class State
    {
        NotRunning,
        Running,
        DetectingBeacon
    };

    using Callback = std::function<void(bool connected, const std::optional<BeaconData> &data, bool same_host)>;
    using LocalCheck = std::function<bool(const std::string &host)>;

    BeaconMonitor(const BeaconConfig &cfg, BeaconSocket &socket, LocalCheck is_local = {});
    ~BeaconMonitor();

    void set_callback(Callback cb);

    /// Opens the socket and starts the loop. @throws TransportError if the group cannot be joined
    void start();
    void stop();

    // One receive cycle. Returns the wait before the next one.
    std::chrono::milliseconds poll_once();

    State state() const;
    std::optional<BeaconData> data() const;
    bool same_host() const;
    unsigned failures() const { return failures_.load(); }

private:
    void fire(bool connected, const std::optional<BeaconData> &data, bool same_host);

    BeaconConfig cfg_;
    BeaconSocket &socket_;
    LocalCheck is_local_;
    WarnLimiter warn_;
    LoopThread loop_;

    mutable std::mutex m_;
    Callback callback_;
    State state_{State::NotRunning};
    std::optional<BeaconData> data_;
    bool same_host_{false};
    std::atomic<unsigned> failures_{0};
};

const char *to_string(BeaconMonitor::State s);

} // namespace xplink
