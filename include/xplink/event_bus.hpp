/*
 * File: include/xplink/event_bus.hpp
 * Project: XPLink
 * Purpose: Typed callback lists for client events
 * Notes:
 *  - handlers are copied under the list mutex and invoked outside it,
 *    so a handler may add or remove handlers
 *  - a std::exception escaping a handler is logged; the remaining handlers still run
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "xplink/connection_state.hpp"
#include "xplink/logger.hpp"
#include "xplink/subscription_manager.hpp"

namespace xplink
{

using HandlerId = uint64_t;

struct RequestFeedback
{
    uint64_t req_id{0};
    bool success{false};
    std::string error_code;
    std::string error_message;
};

template <typename... Args>
class HandlerList
{
public:
    using Handler = std::function<void(Args...)>;

    explicit HandlerList(const char *name) : name_(name) {}

    HandlerId add(Handler h)
    {
        std::scoped_lock lk(m_);
        HandlerId id = ++next_id_;
        handlers_.emplace_back(id, std::move(h));
        return id;
    }

    bool remove(HandlerId id)
    {
        std::scoped_lock lk(m_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it)
        {
            if (it->first == id)
            {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    // Returns the number of handlers that ran without throwing.
    std::size_t emit(Args... args) const
    {
        std::vector<std::pair<HandlerId, Handler>> copy;
        {
            std::scoped_lock lk(m_);
            copy = handlers_;
        }
        std::size_t ok = 0;
        for (const auto &[id, h] : copy)
        {
            try
            {
                h(args...);
                ++ok;
            }
            catch (const std::exception &e)
            {
                XPLINK_LOG_ERROR("{} handler {} threw: {}", name_, id, e.what());
            }
        }
        return ok;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return handlers_.size();
    }

private:
    const char *name_;
    mutable std::mutex m_;
    std::vector<std::pair<HandlerId, Handler>> handlers_;
    HandlerId next_id_{0};
};

struct EventBus
{
    HandlerList<const DatarefUpdate &> dataref_update{"dataref update"};
    HandlerList<const std::string &, bool> command_active{"command active"};
    HandlerList<> open{"open"};
    HandlerList<> close{"close"};
    HandlerList<const RequestFeedback &> feedback{"request feedback"};
    HandlerList<ConnectionState, ConnectionState> state{"state change"};
};

} // namespace xplink
