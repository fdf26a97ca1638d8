/*
 * File: src/subscription_manager.cpp
 * Project: XPLink
 * Purpose: Reference-counted dataref and command subscriptions, array index reconciliation
 * Last updated: 2026-10-19
 */

#include "xplink/subscription_manager.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"
#include "xplink/ws_frames.hpp"

#include <algorithm>

namespace xplink
{

using nlohmann::json;

namespace
{

std::string join(const std::vector<int> &v)
{
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i)
    {
        if (i)
            out += ",";
        out += std::to_string(v[i]);
    }
    return out + "]";
}

} // namespace

DatarefKey parse_dataref_name(const std::string &name)
{
    auto open = name.find('[');
    if (open == std::string::npos)
    {
        if (name.empty())
            throw ContractError("empty dataref path");
        return DatarefKey{name, std::nullopt};
    }
    auto close = name.find(']', open);
    if (open == 0 || close == std::string::npos || close != name.size() - 1 || close == open + 1)
        throw ContractError("malformed dataref name " + name);

    const std::string digits = name.substr(open + 1, close - open - 1);
    if (!std::all_of(digits.begin(), digits.end(), [](char c)
                     { return c >= '0' && c <= '9'; }))
        throw ContractError("malformed dataref index in " + name);
    return DatarefKey{name.substr(0, open), std::stoi(digits)};
}

std::string to_string(const DatarefKey &key)
{
    return key.index ? key.path + "[" + std::to_string(*key.index) + "]" : key.path;
}

SubscriptionManager::SubscriptionManager(MetadataCache &cache, FrameSink &sink, std::size_t history_depth)
    : cache_(cache), sink_(sink), history_depth_(history_depth)
{
}

const DatarefMeta *SubscriptionManager::resolve_locked(const std::string &path, Entry &e)
{
    const uint64_t epoch = cache_.epoch();
    if (e.meta && e.meta_epoch == epoch)
        return e.meta.get();

    if (e.meta)
    {
        auto old = by_id_.find(e.meta->id);
        if (old != by_id_.end() && old->second == path)
            by_id_.erase(old);
    }
    e.meta = cache_.dataref(path);
    e.meta_epoch = epoch;
    if (e.meta)
        by_id_[e.meta->id] = path;
    return e.meta.get();
}

int64_t SubscriptionManager::resolve_command_locked(const std::string &path, CommandEntry &c)
{
    const uint64_t epoch = cache_.epoch();
    if (c.id >= 0 && c.epoch == epoch)
        return c.id;
    auto meta = cache_.command(path);
    c.id = meta ? meta->id : -1;
    c.epoch = epoch;
    return c.id;
}

std::vector<int> SubscriptionManager::counted_indices(const Entry &e) const
{
    std::vector<int> out;
    out.reserve(e.index_counts.size());
    for (const auto &[idx, count] : e.index_counts)
        out.push_back(idx);
    return out;
}

void SubscriptionManager::set_current_locked(Entry &e, std::vector<int> next)
{
    if (next == e.current)
        return;
    if (!e.current.empty())
        e.history.push(e.current);
    e.current = std::move(next);
}

void SubscriptionManager::subscribe(const std::vector<DatarefKey> &keys)
{
    std::scoped_lock lk(m_);

    std::vector<DatarefRequest> requests;
    std::map<std::string, std::size_t> element_request; // path -> position in requests

    for (const auto &key : keys)
    {
        auto &e = table_.try_emplace(key.path, history_depth_).first->second;
        const DatarefMeta *meta = resolve_locked(key.path, e);
        if (key.index && meta && !meta->is_array())
        {
            XPLINK_LOG_WARN("cannot monitor {}: {} is not an array", to_string(key), key.path);
            if (e.empty())
            {
                by_id_.erase(meta->id);
                table_.erase(key.path);
            }
            continue;
        }

        bool first = key.index ? e.index_counts[*key.index]++ == 0 : e.whole++ == 0;
        if (!first || !wired_)
            continue;
        if (!meta)
        {
            XPLINK_LOG_WARN("cannot subscribe {}, no metadata", to_string(key));
            continue;
        }

        if (!key.index)
        {
            requests.push_back(DatarefRequest{meta->id, {}});
            continue;
        }
        auto pos = element_request.find(key.path);
        if (pos == element_request.end())
        {
            pos = element_request.emplace(key.path, requests.size()).first;
            requests.push_back(DatarefRequest{meta->id, {}});
        }
        requests[pos->second].indices.push_back(*key.index);
    }

    for (const auto &[path, pos] : element_request)
    {
        auto &r = requests[pos];
        std::sort(r.indices.begin(), r.indices.end());
        auto &e = table_.at(path);
        XPLINK_LOG_DEBUG("indices {} before {} adding {}", path, join(e.current), join(r.indices));
        set_current_locked(e, counted_indices(e));
    }

    if (!requests.empty())
        sink_.send(dataref_subscription_frame(requests, true));
}

void SubscriptionManager::unsubscribe(const std::vector<DatarefKey> &keys)
{
    std::scoped_lock lk(m_);

    std::vector<std::string> touched;
    std::map<std::string, std::vector<int>> removed;
    std::map<std::string, bool> whole_dropped;

    for (const auto &key : keys)
    {
        auto it = table_.find(key.path);
        if (it == table_.end())
        {
            XPLINK_LOG_WARN("{} currently not monitored", to_string(key));
            continue;
        }
        Entry &e = it->second;
        if (key.index)
        {
            auto c = e.index_counts.find(*key.index);
            if (c == e.index_counts.end())
            {
                XPLINK_LOG_WARN("{} currently not monitored", to_string(key));
                continue;
            }
            if (--c->second == 0)
            {
                e.index_counts.erase(c);
                e.element_values.erase(*key.index);
                removed[key.path].push_back(*key.index);
            }
        }
        else
        {
            if (e.whole == 0)
            {
                XPLINK_LOG_WARN("{} currently not monitored", to_string(key));
                continue;
            }
            if (--e.whole == 0)
            {
                e.whole_value.reset();
                whole_dropped[key.path] = true;
            }
        }
        if (std::find(touched.begin(), touched.end(), key.path) == touched.end())
            touched.push_back(key.path);
    }

    std::vector<DatarefRequest> drops;
    std::vector<DatarefRequest> restores;
    for (const auto &path : touched)
    {
        Entry &e = table_.at(path);
        const DatarefMeta *meta = wired_ ? resolve_locked(path, e) : nullptr;
        auto rm = removed.find(path);
        bool lost_whole = whole_dropped.count(path) > 0;

        if (meta && e.empty())
        {
            // last subscriber gone: drop the identifier whole
            drops.push_back(DatarefRequest{meta->id, {}});
        }
        else if (meta)
        {
            std::vector<int> remaining = counted_indices(e);
            if (lost_whole)
            {
                // a whole unsubscribe also drops the elements on the server
                drops.push_back(DatarefRequest{meta->id, {}});
                restores.push_back(DatarefRequest{meta->id, remaining});
            }
            else if (rm != removed.end())
            {
                std::sort(rm->second.begin(), rm->second.end());
                drops.push_back(DatarefRequest{meta->id, rm->second});
            }
            if (rm != removed.end())
            {
                XPLINK_LOG_DEBUG("indices {} before {} removing {}", path, join(e.current), join(rm->second));
                set_current_locked(e, std::move(remaining));
            }
        }

        if (e.empty())
        {
            if (e.meta)
            {
                auto id = by_id_.find(e.meta->id);
                if (id != by_id_.end() && id->second == path)
                    by_id_.erase(id);
            }
            table_.erase(path);
        }
    }

    if (!drops.empty())
        sink_.send(dataref_subscription_frame(drops, false));
    if (!restores.empty())
        sink_.send(dataref_subscription_frame(restores, true));
}

void SubscriptionManager::subscribe_command(const std::string &path)
{
    std::scoped_lock lk(m_);
    auto &c = commands_[path];
    if (c.count++ != 0 || !wired_)
        return;
    int64_t id = resolve_command_locked(path, c);
    if (id < 0)
    {
        XPLINK_LOG_WARN("cannot monitor command {}, no metadata", path);
        return;
    }
    sink_.send(command_subscription_frame({id}, true));
}

void SubscriptionManager::unsubscribe_command(const std::string &path)
{
    std::scoped_lock lk(m_);
    auto it = commands_.find(path);
    if (it == commands_.end() || it->second.count == 0)
    {
        XPLINK_LOG_WARN("command {} currently not monitored", path);
        return;
    }
    if (--it->second.count != 0)
        return;
    if (wired_)
    {
        int64_t id = resolve_command_locked(path, it->second);
        if (id >= 0)
            sink_.send(command_subscription_frame({id}, false));
    }
    commands_.erase(it);
}

void SubscriptionManager::rebuild()
{
    std::scoped_lock lk(m_);
    by_id_.clear();
    std::size_t missing = 0;
    for (auto &[path, e] : table_)
    {
        e.meta.reset();
        if (!resolve_locked(path, e))
        {
            ++missing;
            XPLINK_LOG_WARN("dataref {} not found in metadata", path);
        }
    }
    for (auto &[path, c] : commands_)
    {
        c.id = -1;
        if (resolve_command_locked(path, c) < 0)
            XPLINK_LOG_WARN("command {} not found in metadata", path);
    }
    XPLINK_LOG_INFO("dataref ids rebuilt ({} subscribed, {} unresolved)", table_.size(), missing);
}

void SubscriptionManager::resubscribe_all()
{
    std::scoped_lock lk(m_);
    wired_ = true;

    std::vector<DatarefRequest> requests;
    for (auto &[path, e] : table_)
    {
        const DatarefMeta *meta = resolve_locked(path, e);
        e.history.clear();
        e.current.clear();
        if (!meta)
            continue;
        if (e.whole > 0)
            requests.push_back(DatarefRequest{meta->id, {}});
        auto indices = counted_indices(e);
        if (!indices.empty())
            requests.push_back(DatarefRequest{meta->id, indices});
        e.current = std::move(indices);
    }

    std::vector<int64_t> command_ids;
    for (auto &[path, c] : commands_)
    {
        int64_t id = resolve_command_locked(path, c);
        if (id >= 0)
            command_ids.push_back(id);
    }

    if (!requests.empty())
        sink_.send(dataref_subscription_frame(requests, true));
    if (!command_ids.empty())
        sink_.send(command_subscription_frame(command_ids, true));
    XPLINK_LOG_INFO("resubscribed {} datarefs, {} commands", requests.size(), command_ids.size());
}

void SubscriptionManager::clear_wire_state()
{
    std::scoped_lock lk(m_);
    wired_ = false;
    by_id_.clear();
    for (auto &[path, e] : table_)
    {
        e.current.clear();
        e.history.clear();
        e.meta.reset();
        e.whole_value.reset();
        e.element_values.clear();
    }
    for (auto &[path, c] : commands_)
        c.id = -1;
}

std::optional<std::vector<DatarefUpdate>> SubscriptionManager::reconcile(int64_t id, const json &payload)
{
    std::scoped_lock lk(m_);
    auto ref = by_id_.find(id);
    if (ref == by_id_.end())
        return std::nullopt;
    auto it = table_.find(ref->second);
    if (it == table_.end() || !it->second.meta)
        return std::nullopt;

    const std::string &path = it->first;
    Entry &e = it->second;
    const DatarefMeta &meta = *e.meta;
    std::vector<DatarefUpdate> out;

    if (!meta.is_array())
    {
        auto v = decode_value(meta.kind, payload);
        if (!v)
        {
            XPLINK_LOG_WARN("dataref {}: unexpected value {} for {}", path, payload.dump(), meta.value_type);
            return out;
        }
        e.whole_value = *v;
        out.push_back(DatarefUpdate{path, std::nullopt, std::move(*v)});
        return out;
    }

    if (!payload.is_array())
    {
        XPLINK_LOG_WARN("dataref array {}: value is not a list ({})", path, payload.dump());
        return out;
    }

    const std::vector<int> *set = nullptr;
    if (!e.current.empty())
    {
        if (payload.size() == e.current.size())
        {
            set = &e.current;
        }
        else
        {
            set = e.history.find_size(payload.size());
            if (set)
                XPLINK_LOG_DEBUG("dataref array {}: {} values matched previous indices {}", path, payload.size(),
                                 join(*set));
        }
    }

    if (set)
    {
        for (std::size_t i = 0; i < set->size(); ++i)
        {
            const json &v = payload[i];
            if (!v.is_number())
            {
                XPLINK_LOG_WARN("dataref {}[{}]: value {} is not a number", path, (*set)[i], v.dump());
                continue;
            }
            const int idx = (*set)[i];
            const double d = v.get<double>();
            // a late payload from an older set may still carry dropped indices
            if (e.index_counts.count(idx) != 0)
                e.element_values[idx] = d;
            out.push_back(DatarefUpdate{path, idx, d});
        }
        return out;
    }

    if (e.whole > 0)
    {
        auto v = decode_value(ValueKind::Array, payload);
        if (v)
        {
            e.whole_value = *v;
            out.push_back(DatarefUpdate{path, std::nullopt, std::move(*v)});
        }
        return out;
    }

    XPLINK_LOG_WARN("dataref array {}: size mismatch ({} vs {}), no previous index set matches, dropped",
                    cache_.equiv(id), payload.size(), e.current.size());
    return out;
}

std::optional<Value> SubscriptionManager::last_value(const DatarefKey &key) const
{
    std::scoped_lock lk(m_);
    auto it = table_.find(key.path);
    if (it == table_.end())
        return std::nullopt;
    const Entry &e = it->second;
    if (key.index)
    {
        auto v = e.element_values.find(*key.index);
        if (v != e.element_values.end())
            return Value{v->second};
        if (e.whole_value && std::holds_alternative<std::vector<double>>(*e.whole_value))
        {
            const auto &arr = std::get<std::vector<double>>(*e.whole_value);
            if (*key.index >= 0 && static_cast<std::size_t>(*key.index) < arr.size())
                return Value{arr[*key.index]};
        }
        return std::nullopt;
    }
    return e.whole_value;
}

unsigned SubscriptionManager::ref_count(const DatarefKey &key) const
{
    std::scoped_lock lk(m_);
    auto it = table_.find(key.path);
    if (it == table_.end())
        return 0;
    if (!key.index)
        return it->second.whole;
    auto c = it->second.index_counts.find(*key.index);
    return c == it->second.index_counts.end() ? 0 : c->second;
}

unsigned SubscriptionManager::command_ref_count(const std::string &path) const
{
    std::scoped_lock lk(m_);
    auto it = commands_.find(path);
    return it == commands_.end() ? 0 : it->second.count;
}

std::vector<int> SubscriptionManager::current_indices(const std::string &path) const
{
    std::scoped_lock lk(m_);
    auto it = table_.find(path);
    return it == table_.end() ? std::vector<int>{} : it->second.current;
}

std::vector<std::vector<int>> SubscriptionManager::index_history(const std::string &path) const
{
    std::scoped_lock lk(m_);
    auto it = table_.find(path);
    if (it == table_.end())
        return {};
    const auto &sets = it->second.history.sets();
    return std::vector<std::vector<int>>(sets.begin(), sets.end());
}

bool SubscriptionManager::on_wire() const
{
    std::scoped_lock lk(m_);
    return wired_;
}

} // namespace xplink
