/*
 * File: src/beacon_monitor.cpp
 * Project: XPLink
 * Purpose: Watches the simulator discovery beacon
 * Last updated: 2026-10-19
 */

#include "xplink/beacon_monitor.hpp"
#include "xplink/errors.hpp"
#include "xplink/net_interfaces.hpp"

namespace xplink
{

const char *to_string(BeaconMonitor::State s)
{
    switch (s)
    {
    case BeaconMonitor::State::NotRunning:
        return "not running";
    case BeaconMonitor::State::Running:
        return "running";
    case BeaconMonitor::State::DetectingBeacon:
        return "detecting beacon";
    }
    return "unknown";
}

BeaconMonitor::BeaconMonitor(const BeaconConfig &cfg, BeaconSocket &socket, LocalCheck is_local)
    : cfg_(cfg), socket_(socket), is_local_(is_local ? std::move(is_local) : LocalCheck(is_local_address)),
      warn_(cfg.warn_every), loop_("beacon monitor")
{
}

BeaconMonitor::~BeaconMonitor()
{
    stop();
}

void BeaconMonitor::set_callback(Callback cb)
{
    std::scoped_lock lk(m_);
    callback_ = std::move(cb);
}

void BeaconMonitor::fire(bool connected, const std::optional<BeaconData> &data, bool same_host)
{
    Callback cb;
    {
        std::scoped_lock lk(m_);
        cb = callback_;
    }
    if (!cb)
        return;
    try
    {
        cb(connected, data, same_host);
    }
    catch (const std::exception &e)
    {
        XPLINK_LOG_ERROR("beacon callback threw: {}", e.what());
    }
}

void BeaconMonitor::start()
{
    if (loop_.running())
        return;
    socket_.open(cfg_.group, cfg_.port);
    {
        std::scoped_lock lk(m_);
        state_ = State::Running;
    }
    failures_ = 0;
    warn_.reset();
    XPLINK_LOG_INFO("beacon monitor listening on {}:{}", cfg_.group, cfg_.port);
    loop_.start([this](LoopThread &loop)
                {
        while (loop.wait_for(poll_once()))
        {
        } });
}

void BeaconMonitor::stop()
{
    loop_.stop();
    socket_.close();

    bool was_detecting = false;
    {
        std::scoped_lock lk(m_);
        if (state_ == State::NotRunning)
            return;
        was_detecting = state_ == State::DetectingBeacon;
        state_ = State::NotRunning;
        data_.reset();
    }
    if (was_detecting)
        fire(false, std::nullopt, false);
    XPLINK_LOG_INFO("beacon monitor stopped");
}

std::chrono::milliseconds BeaconMonitor::poll_once()
{
    std::optional<Datagram> dgram;
    try
    {
        dgram = socket_.receive(cfg_.receive_timeout);
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_DEBUG("beacon receive failed: {}", e.what());
    }

    if (dgram)
    {
        try
        {
            BeaconData b = decode_beacon(dgram->payload, dgram->sender);
            const bool same = is_local_(b.host);
            bool notify = false;
            {
                std::scoped_lock lk(m_);
                notify = state_ != State::DetectingBeacon || !data_ || *data_ != b;
                state_ = State::DetectingBeacon;
                data_ = b;
                same_host_ = same;
            }
            failures_ = 0;
            warn_.reset();
            if (notify)
            {
                XPLINK_LOG_INFO("beacon: {}{}", to_string(b), same ? " (this host)" : "");
                fire(true, b, same);
            }
            return cfg_.probe_interval;
        }
        catch (const UnsupportedVersion &e)
        {
            XPLINK_LOG_ERROR("simulator version not supported: {}", e.what());
            std::scoped_lock lk(m_);
            data_.reset();
        }
        catch (const DecodeError &e)
        {
            XPLINK_LOG_WARN("invalid beacon from {}: {}", dgram->sender, e.what());
        }
    }

    ++failures_;
    bool lost = false;
    {
        std::scoped_lock lk(m_);
        if (state_ == State::DetectingBeacon)
        {
            state_ = State::Running;
            lost = true;
        }
        data_.reset();
    }
    if (lost)
    {
        XPLINK_LOG_WARN("beacon lost");
        fire(false, std::nullopt, false);
    }
    if (warn_.allow())
        XPLINK_LOG_WARN("no simulator beacon on {}:{} ({} attempts)", cfg_.group, cfg_.port, failures_.load());
    return cfg_.probe_interval;
}

BeaconMonitor::State BeaconMonitor::state() const
{
    std::scoped_lock lk(m_);
    return state_;
}

std::optional<BeaconData> BeaconMonitor::data() const
{
    std::scoped_lock lk(m_);
    return data_;
}

bool BeaconMonitor::same_host() const
{
    std::scoped_lock lk(m_);
    return same_host_;
}

} // namespace xplink
