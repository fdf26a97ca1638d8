/*
 * File: include/xplink/listener.hpp
 * Project: XPLink
 * Purpose: WebSocket receive loop
 * Notes:
 *  - 1 s receive timeout until the first message (Listening), 5 s after (Receiving)
 *  - a closed channel ends the loop and tells the connection monitor
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>

#include "xplink/config.hpp"
#include "xplink/connection_monitor.hpp"
#include "xplink/dispatcher.hpp"
#include "xplink/loop_thread.hpp"
#include "xplink/subscription_manager.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

class Listener
{
public:
    Listener(const ClientConfig &cfg, WsChannel &ws, Dispatcher &dispatcher, SubscriptionManager &subs,
             ConnectionMonitor &monitor);

    void start();
    void stop();
    bool running() const { return loop_.running(); }

    // One bounded receive. False once the channel is closed.
    bool step();

    std::chrono::milliseconds receive_timeout() const;
    std::size_t reads() const { return reads_.load(); }

private:
    const ClientConfig &cfg_;
    WsChannel &ws_;
    Dispatcher &dispatcher_;
    SubscriptionManager &subs_;
    ConnectionMonitor &monitor_;
    LoopThread loop_;

    std::atomic<std::size_t> reads_{0};
    unsigned timeouts_{0};
};

} // namespace xplink
