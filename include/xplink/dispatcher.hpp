/*
 * File: include/xplink/dispatcher.hpp
 * Project: XPLink
 * Purpose: Request id correlation and inbound frame routing
 * Notes:
 *  - req_id strictly increases for the life of the dispatcher, across reconnects
 *  - at most max_requests tracked; resolved entries are pruned first, oldest first
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "xplink/event_bus.hpp"
#include "xplink/metadata_cache.hpp"
#include "xplink/subscription_manager.hpp"
#include "xplink/transport.hpp"

namespace xplink
{

enum class RequestState
{
    Unknown,
    Pending,
    Succeeded,
    Failed
};

const char *to_string(RequestState s);

class Dispatcher : public FrameSink
{
public:
    Dispatcher(EventBus &events, const MetadataCache &cache, std::size_t max_requests = 1024);

    // nullptr detaches; frames sent while detached are dropped.
    void attach(WsChannel *channel);
    bool attached() const;

    // Tags `frame` with the next req_id and hands it to the channel.
    std::optional<uint64_t> send(nlohmann::json frame) override;

    // Routes one inbound text frame. Malformed frames are logged and skipped.
    void handle(const std::string &text, SubscriptionManager &subs);

    RequestState request(uint64_t req_id) const;
    uint64_t last_request_id() const;
    std::size_t tracked_requests() const;

private:
    void prune_locked();

    EventBus &events_;
    const MetadataCache &cache_;
    std::size_t max_requests_;

    mutable std::mutex m_;
    WsChannel *channel_{nullptr};
    uint64_t next_req_{0};
    std::map<uint64_t, RequestState> requests_;
};

} // namespace xplink
