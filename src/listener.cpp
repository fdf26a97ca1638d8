/*
 * File: src/listener.cpp
 * Project: XPLink
 * Purpose: WebSocket receive loop
 * Last updated: 2026-10-19
 */

#include "xplink/listener.hpp"
#include "xplink/logger.hpp"

namespace xplink
{

Listener::Listener(const ClientConfig &cfg, WsChannel &ws, Dispatcher &dispatcher, SubscriptionManager &subs,
                   ConnectionMonitor &monitor)
    : cfg_(cfg), ws_(ws), dispatcher_(dispatcher), subs_(subs), monitor_(monitor),
      loop_("websocket listener", cfg.join_timeout)
{
}

void Listener::start()
{
    if (loop_.running())
        return;
    reads_ = 0;
    timeouts_ = 0;
    monitor_.set_state(ConnectionState::Listening);
    loop_.start([this](LoopThread &loop)
                {
        while (!loop.stopping() && step())
        {
        } });
}

void Listener::stop()
{
    loop_.stop();
}

std::chrono::milliseconds Listener::receive_timeout() const
{
    return reads_ == 0 ? cfg_.receive_timeout_searching : cfg_.receive_timeout_steady;
}

bool Listener::step()
{
    std::string text;
    switch (ws_.receive(text, receive_timeout()))
    {
    case WsChannel::ReadStatus::Timeout:
        if (timeouts_++ % 50 == 0)
            XPLINK_LOG_DEBUG("..receive timeout ({} ms), waiting for response from simulator..",
                             receive_timeout().count());
        return true;

    case WsChannel::ReadStatus::Closed:
        XPLINK_LOG_WARN("websocket connection closed");
        monitor_.notify_dropped();
        return false;

    case WsChannel::ReadStatus::Message:
        break;
    }

    if (reads_++ == 0)
    {
        XPLINK_LOG_INFO("..first message after {} timeouts..", timeouts_);
        monitor_.set_state(ConnectionState::Receiving);
    }
    timeouts_ = 0;
    dispatcher_.handle(text, subs_);
    return true;
}

} // namespace xplink
