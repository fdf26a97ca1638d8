/*
 * File: include/xplink/metadata_cache.hpp
 * Project: XPLink
 * Purpose: Name <-> identifier tables for datarefs and commands
 * Notes:
 *  - tables are immutable snapshots, swapped whole on reload
 *  - identifiers are only valid for one epoch; reload and invalidate bump it
 *  - reload interval is measured in simulator uptime, not wall clock
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "xplink/value.hpp"

namespace xplink
{

struct DatarefMeta
{
    std::string name;
    int64_t id{-1};
    std::string value_type;
    ValueKind kind{ValueKind::Scalar};
    bool is_writable{false};

    bool is_array() const { return kind == ValueKind::Array; }
};

struct CommandMeta
{
    std::string name;
    int64_t id{-1};
    std::string description;
};

/// @throws DecodeError if "name" or "id" is missing
DatarefMeta dataref_meta_from_json(const nlohmann::json &j);
CommandMeta command_meta_from_json(const nlohmann::json &j);

template <typename Meta>
class MetaTable
{
public:
    MetaTable() = default;

    MetaTable(std::vector<Meta> metas, nlohmann::json raw) : raw_(std::move(raw))
    {
        by_name_.reserve(metas.size());
        by_id_.reserve(metas.size());
        for (auto &m : metas)
        {
            auto p = std::make_shared<const Meta>(std::move(m));
            by_name_[p->name] = p;
            by_id_[p->id] = p;
        }
    }

    std::shared_ptr<const Meta> find(const std::string &name) const
    {
        auto it = by_name_.find(name);
        return it == by_name_.end() ? nullptr : it->second;
    }

    std::shared_ptr<const Meta> find(int64_t id) const
    {
        auto it = by_id_.find(id);
        return it == by_id_.end() ? nullptr : it->second;
    }

    std::string equiv(int64_t id) const
    {
        auto m = find(id);
        if (m)
            return std::to_string(id) + "(" + m->name + ")";
        return "no equivalence for " + std::to_string(id);
    }

    std::size_t size() const { return by_name_.size(); }
    bool empty() const { return by_name_.empty(); }
    const nlohmann::json &raw() const { return raw_; }

private:
    std::unordered_map<std::string, std::shared_ptr<const Meta>> by_name_;
    std::unordered_map<int64_t, std::shared_ptr<const Meta>> by_id_;
    nlohmann::json raw_ = nlohmann::json::array();
};

// Where full tables come from. RestApi in production, fakes in tests.
class MetadataSource
{
public:
    virtual ~MetadataSource() = default;
    virtual nlohmann::json fetch_datarefs() = 0;
    virtual nlohmann::json fetch_commands() = 0;
    virtual bool supports_commands() const = 0;
    // Simulator running time in seconds, nullopt if unavailable.
    virtual std::optional<double> uptime() = 0;
};

class MetadataCache
{
public:
    enum class ReloadResult
    {
        Reloaded,
        Skipped,
        Failed
    };

    explicit MetadataCache(std::chrono::seconds min_reload_interval = std::chrono::seconds(10));

    /**
     * Replace both tables from `source`.
     *
     * Skipped without any fetch when less than the minimum interval of simulator
     * uptime has passed since the last reload, unless `force`. On failure the
     * previous tables stay in place.
     */
    ReloadResult reload(MetadataSource &source, bool force = false);

    std::shared_ptr<const DatarefMeta> dataref(const std::string &name) const;
    std::shared_ptr<const DatarefMeta> dataref(int64_t id) const;
    std::shared_ptr<const CommandMeta> command(const std::string &name) const;
    std::shared_ptr<const CommandMeta> command(int64_t id) const;

    std::string equiv(int64_t dataref_id) const;
    std::string command_equiv(int64_t command_id) const;

    // Drops the tables and starts a new epoch so stale identifiers are never reused.
    void invalidate();

    uint64_t epoch() const { return epoch_.load(); }
    bool has_data() const;
    std::size_t dataref_count() const;
    std::size_t command_count() const;
    std::optional<double> last_reload_uptime() const;

    // Writes <prefix>-datarefs.json and <prefix>-commands.json.
    void save(const std::string &prefix) const;

private:
    struct Snapshot
    {
        MetaTable<DatarefMeta> datarefs;
        MetaTable<CommandMeta> commands;
    };

    std::shared_ptr<const Snapshot> snapshot() const;

    std::chrono::seconds min_interval_;
    mutable std::mutex m_;
    std::shared_ptr<const Snapshot> snap_;
    std::optional<double> last_uptime_;
    std::atomic<uint64_t> epoch_{0};
    std::mutex reload_m_; // one reload at a time
};

} // namespace xplink
