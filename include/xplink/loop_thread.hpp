/*
 * File: include/xplink/loop_thread.hpp
 * Project: XPLink
 * Purpose: Background loop with a cancellable wait
 * Notes:
 *  - stop() waits up to the join timeout, warns on overrun, then joins anyway
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace xplink
{

class LoopThread
{
public:
    using Body = std::function<void(LoopThread &)>;

    explicit LoopThread(std::string name, std::chrono::milliseconds join_timeout = std::chrono::milliseconds(12000));
    ~LoopThread();

    LoopThread(const LoopThread &) = delete;
    LoopThread &operator=(const LoopThread &) = delete;

    // No-op if already running.
    void start(Body body);
    void stop();

    // Sleeps up to `d`. Returns false when the loop should end.
    bool wait_for(std::chrono::milliseconds d);

    // Cuts the current wait short without stopping.
    void wake();

    bool stopping() const { return stop_.load(); }
    bool running() const { return running_.load(); }
    bool on_loop_thread() const { return std::this_thread::get_id() == thread_.get_id(); }
    const std::string &name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds join_timeout_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    std::mutex m_;
    std::condition_variable cv_;
    bool woken_{false};
    bool done_{false};
};

} // namespace xplink
