/*
 * File: include/xplink/subscription_manager.hpp
 * Project: XPLink
 * Purpose: Reference-counted dataref and command subscriptions, array index reconciliation
 * Notes:
 *  - table keyed by path; id -> path reverse index rebuilt after each metadata reload
 *  - wire subscribe on shared count 0 -> 1 only, unsubscribe on 1 -> 0 only
 *  - array payloads carry one value per requested index, in sorted index order;
 *    a payload sized for an older index set is matched against the set history
 *  - frames are handed to the sink under the table mutex so wire order follows table order
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "xplink/metadata_cache.hpp"
#include "xplink/value.hpp"

namespace xplink
{

// "sim/arr[3]" -> {"sim/arr", 3}
struct DatarefKey
{
    std::string path;
    std::optional<int> index;

    bool operator==(const DatarefKey &o) const { return path == o.path && index == o.index; }
};

/// @throws ContractError on an empty path or a malformed index suffix
DatarefKey parse_dataref_name(const std::string &name);
std::string to_string(const DatarefKey &key);

struct DatarefUpdate
{
    std::string path;
    std::optional<int> index; // set for array elements
    Value value;
};

// Outbound side of the WebSocket. Returns the request id, nullopt when nothing was sent.
class FrameSink
{
public:
    virtual ~FrameSink() = default;
    virtual std::optional<uint64_t> send(nlohmann::json frame) = 0;
};

// Previous index sets of one array dataref, most recent first.
class IndexHistory
{
public:
    explicit IndexHistory(std::size_t depth = 3) : depth_(depth == 0 ? 1 : depth) {}

    void push(std::vector<int> set)
    {
        sets_.push_front(std::move(set));
        while (sets_.size() > depth_)
            sets_.pop_back();
    }

    // Most recent set with `size` entries.
    const std::vector<int> *find_size(std::size_t size) const
    {
        for (const auto &s : sets_)
            if (s.size() == size)
                return &s;
        return nullptr;
    }

    void clear() { sets_.clear(); }
    std::size_t size() const { return sets_.size(); }
    const std::deque<std::vector<int>> &sets() const { return sets_; }

private:
    std::size_t depth_;
    std::deque<std::vector<int>> sets_;
};

class SubscriptionManager
{
public:
    SubscriptionManager(MetadataCache &cache, FrameSink &sink, std::size_t history_depth = 3);

    // One bulk frame for every identifier whose wire state changes.
    void subscribe(const std::vector<DatarefKey> &keys);
    void unsubscribe(const std::vector<DatarefKey> &keys);

    void subscribe_command(const std::string &path);
    void unsubscribe_command(const std::string &path);

    // Re-resolve identifiers against the current metadata snapshot.
    void rebuild();

    // Fresh connection: request everything that has subscribers, in one frame per kind.
    void resubscribe_all();

    // Connection lost: nothing is on the wire any more. Reference counts are kept.
    void clear_wire_state();

    /**
     * Map an inbound dataref payload to subscribed keys and remember the values.
     *
     * @return nullopt if `id` is not in the table, otherwise the updates to deliver
     *         (possibly none when the payload could not be reconciled)
     */
    std::optional<std::vector<DatarefUpdate>> reconcile(int64_t id, const nlohmann::json &payload);

    std::optional<Value> last_value(const DatarefKey &key) const;

    unsigned ref_count(const DatarefKey &key) const;
    unsigned command_ref_count(const std::string &path) const;
    std::vector<int> current_indices(const std::string &path) const;
    std::vector<std::vector<int>> index_history(const std::string &path) const;
    bool on_wire() const;

private:
    struct Entry
    {
        explicit Entry(std::size_t depth) : history(depth) {}

        unsigned whole{0};
        std::map<int, unsigned> index_counts;
        std::vector<int> current; // sorted, as last requested on the wire
        IndexHistory history;

        std::shared_ptr<const DatarefMeta> meta;
        uint64_t meta_epoch{0};

        std::optional<Value> whole_value;
        std::map<int, double> element_values;

        bool empty() const { return whole == 0 && index_counts.empty(); }
    };

    struct CommandEntry
    {
        unsigned count{0};
        int64_t id{-1};
        uint64_t epoch{0};
    };

    // all *_locked helpers expect m_ held
    const DatarefMeta *resolve_locked(const std::string &path, Entry &e);
    int64_t resolve_command_locked(const std::string &path, CommandEntry &c);
    void set_current_locked(Entry &e, std::vector<int> next);
    std::vector<int> counted_indices(const Entry &e) const;

    MetadataCache &cache_;
    FrameSink &sink_;
    std::size_t history_depth_;

    mutable std::mutex m_;
    std::unordered_map<std::string, Entry> table_;
    std::unordered_map<int64_t, std::string> by_id_;
    std::unordered_map<std::string, CommandEntry> commands_;
    bool wired_{false};
};

} // namespace xplink
