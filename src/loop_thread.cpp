/*
 * File: src/loop_thread.cpp
 * Project: XPLink
 * Purpose: Background loop with a cancellable wait
 * Last updated: 2026-10-19
 */

#include "xplink/loop_thread.hpp"
#include "xplink/logger.hpp"

namespace xplink
{

LoopThread::LoopThread(std::string name, std::chrono::milliseconds join_timeout)
    : name_(std::move(name)), join_timeout_(join_timeout)
{
}

LoopThread::~LoopThread()
{
    stop();
}

void LoopThread::start(Body body)
{
    if (running_)
        return;
    if (thread_.joinable())
        thread_.join(); // previous run ended by itself

    stop_ = false;
    {
        std::scoped_lock lk(m_);
        woken_ = false;
        done_ = false;
    }
    running_ = true;
    thread_ = std::thread([this, body = std::move(body)]
                          {
        XPLINK_LOG_DEBUG("{} started", name_);
        try
        {
            body(*this);
        }
        catch (const std::exception &e)
        {
            XPLINK_LOG_ERROR("{} ended on error: {}", name_, e.what());
        }
        {
            std::scoped_lock lk(m_);
            done_ = true;
        }
        running_ = false;
        cv_.notify_all();
        XPLINK_LOG_DEBUG("{} ended", name_); });
}

void LoopThread::stop()
{
    if (!thread_.joinable())
        return;
    if (on_loop_thread())
    {
        // asked from inside the loop: just flag it, the owner joins later
        stop_ = true;
        return;
    }

    {
        std::unique_lock lk(m_);
        stop_ = true;
        cv_.notify_all();
        if (!cv_.wait_for(lk, join_timeout_, [this]
                          { return done_; }))
        {
            XPLINK_LOG_WARN("{} did not stop within {} ms, may hang", name_, join_timeout_.count());
        }
    }
    thread_.join();
}

bool LoopThread::wait_for(std::chrono::milliseconds d)
{
    std::unique_lock lk(m_);
    cv_.wait_for(lk, d, [this]
                 { return stop_.load() || woken_; });
    woken_ = false;
    return !stop_;
}

void LoopThread::wake()
{
    {
        std::scoped_lock lk(m_);
        woken_ = true;
    }
    cv_.notify_all();
}

} // namespace xplink
