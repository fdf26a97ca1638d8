/*
 * File: src/connection_monitor.cpp
 * Project: XPLink
 * Purpose: REST probe / WebSocket open / reconnect state machine
 * Last updated: 2026-10-19
 */

#include "xplink/connection_monitor.hpp"
#include "xplink/errors.hpp"
#include "xplink/version.hpp"

namespace xplink
{

ConnectionMonitor::ConnectionMonitor(const ClientConfig &cfg, RestApi &rest, WsChannel &ws, EventBus &events,
                                     Hooks hooks)
    : cfg_(cfg), rest_(rest), ws_(ws), events_(events), hooks_(std::move(hooks)), open_warn_(cfg.warn_every),
      loop_("connection monitor", cfg.join_timeout), beacon_present_(!cfg.use_beacon)
{
}

ConnectionMonitor::~ConnectionMonitor()
{
    stop();
}

void ConnectionMonitor::start()
{
    loop_.start([this](LoopThread &loop)
                {
        while (loop.wait_for(step()))
        {
        } });
}

void ConnectionMonitor::stop()
{
    loop_.stop();
}

ConnectionState ConnectionMonitor::state() const
{
    std::scoped_lock lk(m_);
    return state_;
}

void ConnectionMonitor::set_state(ConnectionState s)
{
    ConnectionState prev;
    {
        std::scoped_lock lk(m_);
        if (state_ == s)
            return;
        prev = state_;
        state_ = s;
    }
    XPLINK_LOG_INFO("connection state: {} -> {}", to_string(prev), to_string(s));
    events_.state.emit(prev, s);
}

void ConnectionMonitor::restart()
{
    open_failures_ = 0;
    if (given_up_.exchange(false))
        XPLINK_LOG_INFO("connection attempts restarted");
    loop_.wake();
}

void ConnectionMonitor::reset()
{
    connected_ = false;
    dropped_ = false;
    rest_reachable_ = false;
    open_failures_ = 0;
    given_up_ = false;
}

void ConnectionMonitor::notify_dropped()
{
    dropped_ = true;
    loop_.wake();
}

void ConnectionMonitor::beacon_found()
{
    {
        std::scoped_lock lk(m_);
        if (beacon_lost_at_)
            XPLINK_LOG_DEBUG("beacon back, stop aborted");
        beacon_present_ = true;
        beacon_lost_at_.reset();
    }
    if (!connected_)
        set_state(ConnectionState::ReceivingBeacon);
    restart();
}

void ConnectionMonitor::beacon_lost(Clock::time_point when)
{
    {
        std::scoped_lock lk(m_);
        beacon_present_ = false;
        if (!beacon_lost_at_)
            beacon_lost_at_ = when;
    }
    if (!connected_)
        set_state(ConnectionState::NoBeacon);
    else
        XPLINK_LOG_INFO("beacon not detected, will drop connection in {} secs.",
                        std::chrono::duration_cast<std::chrono::seconds>(cfg_.beacon.grace).count());
    loop_.wake();
}

bool ConnectionMonitor::wait_connection(std::chrono::milliseconds timeout)
{
    std::unique_lock lk(m_);
    return cv_.wait_for(lk, timeout, [this]
                        { return connected_.load(); });
}

void ConnectionMonitor::drop(const char *why)
{
    XPLINK_LOG_WARN("websocket connection closed ({})", why);
    connected_ = false;
    if (hooks_.on_close)
        hooks_.on_close();
    ws_.close();
    set_state(ConnectionState::WsDisconnected);
    events_.close.emit();
}

void ConnectionMonitor::check_simulator_version()
{
    auto v = rest_.simulator_version();
    if (!v)
    {
        XPLINK_LOG_WARN("simulator did not report its version");
        return;
    }
    const std::string base = base_version(*v);
    if (natural_compare(base, cfg_.min_sim_version) < 0 || natural_compare(base, cfg_.max_sim_version) > 0)
        XPLINK_LOG_WARN("simulator version {} outside tested range [{}, {}]", *v, cfg_.min_sim_version,
                        cfg_.max_sim_version);
    else
        XPLINK_LOG_DEBUG("simulator version {}", *v);
}

std::chrono::milliseconds ConnectionMonitor::step()
{
    try
    {
        if (connected_)
        {
            if (dropped_.exchange(false) || !ws_.is_open())
            {
                drop("receive loop ended");
                return cfg_.retry_interval;
            }
        }
        dropped_ = false;

        std::optional<Clock::time_point> lost_at;
        bool beacon_present;
        {
            std::scoped_lock lk(m_);
            lost_at = beacon_lost_at_;
            beacon_present = beacon_present_;
        }
        if (lost_at && Clock::now() - *lost_at >= cfg_.beacon.grace)
        {
            {
                std::scoped_lock lk(m_);
                beacon_lost_at_.reset();
            }
            if (connected_)
                drop("beacon lost");
            if (hooks_.on_beacon_expired)
                hooks_.on_beacon_expired();
            set_state(ConnectionState::NoBeacon);
        }

        if (connected_)
            return cfg_.reconnect_interval;
        if (!beacon_present)
            return cfg_.beacon.probe_interval;

        if (!rest_.reachable())
        {
            rest_reachable_ = false;
            if (ever_reachable_)
                set_state(ConnectionState::RestUnreachable);
            return given_up_ ? cfg_.reconnect_interval : cfg_.retry_interval;
        }
        if (given_up_)
        {
            // REST answering after the reconnect pause restarts the open cycle
            open_failures_ = 0;
            given_up_ = false;
            XPLINK_LOG_INFO("rest api reachable, connection attempts restarted");
        }
        rest_reachable_ = true;
        ever_reachable_ = true;
        set_state(ConnectionState::RestReachable);

        rest_.reset_connection(); // capabilities are per connection
        const std::string target = hooks_.target ? hooks_.target() : rest_.versioned_root();
        try
        {
            ws_.open(rest_.host(), rest_.port(), target);
        }
        catch (const TransportError &e)
        {
            const unsigned n = ++open_failures_;
            if (n >= cfg_.max_open_failures)
            {
                given_up_ = true;
                XPLINK_LOG_ERROR("websocket open failed {} times, retrying in {} secs.: {}", n,
                                 std::chrono::duration_cast<std::chrono::seconds>(cfg_.reconnect_interval).count(),
                                 e.what());
                return cfg_.reconnect_interval;
            }
            else if (open_warn_.allow())
            {
                XPLINK_LOG_WARN("websocket open failed ({}/{}): {}", n, cfg_.max_open_failures, e.what());
            }
            return cfg_.retry_interval;
        }
        open_failures_ = 0;
        open_warn_.reset();
        set_state(ConnectionState::WsConnected);
        check_simulator_version();

        try
        {
            if (hooks_.on_open)
                hooks_.on_open();
        }
        catch (const Error &e)
        {
            XPLINK_LOG_ERROR("connection setup failed: {}", e.what());
            if (hooks_.on_close)
                hooks_.on_close();
            ws_.close();
            set_state(ConnectionState::WsDisconnected);
            return cfg_.retry_interval;
        }

        {
            std::scoped_lock lk(m_);
            connected_ = true;
        }
        cv_.notify_all();
        XPLINK_LOG_INFO("connected to {}:{}{}", rest_.host(), rest_.port(), target);
        events_.open.emit();
        return cfg_.reconnect_interval;
    }
    catch (const std::exception &e)
    {
        XPLINK_LOG_ERROR("connection monitor: {}", e.what());
        return cfg_.retry_interval;
    }
}

} // namespace xplink
