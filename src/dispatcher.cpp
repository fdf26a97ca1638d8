/*
 * File: src/dispatcher.cpp
 * Project: XPLink
 * Purpose: Request id correlation and inbound frame routing
 * Last updated: 2026-10-19
 */

#include "xplink/dispatcher.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"
#include "xplink/ws_frames.hpp"

namespace xplink
{

const char *to_string(RequestState s)
{
    switch (s)
    {
    case RequestState::Unknown:
        return "unknown";
    case RequestState::Pending:
        return "pending";
    case RequestState::Succeeded:
        return "succeeded";
    case RequestState::Failed:
        return "failed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(EventBus &events, const MetadataCache &cache, std::size_t max_requests)
    : events_(events), cache_(cache), max_requests_(max_requests == 0 ? 1 : max_requests)
{
}

void Dispatcher::attach(WsChannel *channel)
{
    std::scoped_lock lk(m_);
    channel_ = channel;
}

bool Dispatcher::attached() const
{
    std::scoped_lock lk(m_);
    return channel_ != nullptr && channel_->is_open();
}

std::optional<uint64_t> Dispatcher::send(nlohmann::json frame)
{
    std::scoped_lock lk(m_);
    if (channel_ == nullptr || !channel_->is_open())
    {
        XPLINK_LOG_WARN("not connected, {} not sent", frame.value("type", std::string("frame")));
        return std::nullopt;
    }

    const uint64_t req_id = ++next_req_;
    std::string text = tag_frame(std::move(frame), req_id);
    try
    {
        channel_->send(text);
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_WARN("request {} not sent: {}", req_id, e.what());
        return std::nullopt;
    }
    XPLINK_TRAFFIC(">>SND {}", text);
    requests_[req_id] = RequestState::Pending;
    prune_locked();
    return req_id;
}

void Dispatcher::prune_locked()
{
    for (auto it = requests_.begin(); requests_.size() > max_requests_ && it != requests_.end();)
    {
        if (it->second != RequestState::Pending)
            it = requests_.erase(it);
        else
            ++it;
    }
    // nothing answered: drop the oldest pending ones
    while (requests_.size() > max_requests_)
        requests_.erase(requests_.begin());
}

void Dispatcher::handle(const std::string &text, SubscriptionManager &subs)
{
    XPLINK_TRAFFIC("<<RCV {}", text);

    InboundFrame frame;
    try
    {
        frame = parse_frame(text);
    }
    catch (const DecodeError &e)
    {
        XPLINK_LOG_WARN("decode frame failed: {}", e.what());
        return;
    }

    if (auto *r = std::get_if<ResultFrame>(&frame))
    {
        {
            std::scoped_lock lk(m_);
            auto it = requests_.find(r->req_id);
            if (it != requests_.end())
                it->second = r->success ? RequestState::Succeeded : RequestState::Failed;
            else
                XPLINK_LOG_DEBUG("result for untracked request {}", r->req_id);
        }
        if (!r->success)
            XPLINK_LOG_WARN("request {} failed: {} {}", r->req_id, r->error_code, r->error_message);
        events_.feedback.emit(RequestFeedback{r->req_id, r->success, r->error_code, r->error_message});
        return;
    }

    if (auto *u = std::get_if<DatarefUpdateFrame>(&frame))
    {
        for (const auto &[id, raw] : u->values)
        {
            auto updates = subs.reconcile(id, raw);
            if (!updates)
            {
                XPLINK_LOG_DEBUG("no dataref for id={} (late update of a dropped subscription?)", cache_.equiv(id));
                continue;
            }
            for (const auto &up : *updates)
                events_.dataref_update.emit(up);
        }
        return;
    }

    if (auto *c = std::get_if<CommandActiveFrame>(&frame))
    {
        for (const auto &[id, active] : c->values)
        {
            auto meta = cache_.command(id);
            if (!meta)
            {
                XPLINK_LOG_WARN("no command for id={}", cache_.command_equiv(id));
                continue;
            }
            events_.command_active.emit(meta->name, active);
        }
        return;
    }

    const auto &unknown = std::get<UnknownFrame>(frame);
    XPLINK_LOG_WARN("invalid response type {}: {}", unknown.type, unknown.body.dump());
}

} // namespace xplink
