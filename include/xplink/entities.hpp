/*
 * File: include/xplink/entities.hpp
 * Project: XPLink
 * Purpose: Dataref and Command handles used by applications
 * Notes:
 *  - a handle resolves its metadata lazily and again whenever the metadata epoch moves
 *  - the monitor count of a handle is its own; the shared wire count lives in the
 *    subscription table
 *  - a handle destroyed while monitored hands its count back to the backend
 *  - handles see the backend through a weak_ptr; once it is gone every call
 *    throws NotConnected and destruction releases nothing
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xplink/metadata_cache.hpp"
#include "xplink/subscription_manager.hpp"
#include "xplink/value.hpp"

namespace xplink
{

// What a handle needs from the client that created it.
class EntityBackend
{
public:
    virtual ~EntityBackend() = default;

    /// @throws UnknownPath, NotConnected
    virtual std::shared_ptr<const DatarefMeta> dataref_meta(const std::string &path) = 0;
    virtual std::shared_ptr<const CommandMeta> command_meta(const std::string &path) = 0;
    virtual uint64_t metadata_epoch() const = 0;

    // Last value pushed over the WebSocket, if the key is subscribed.
    virtual std::optional<Value> monitored_value(const DatarefKey &key) = 0;
    virtual nlohmann::json fetch_value(const DatarefMeta &meta) = 0;
    virtual void write_value(const DatarefMeta &meta, std::optional<int> index, const nlohmann::json &value) = 0;
    virtual void execute_command(const CommandMeta &meta, double duration) = 0;

    virtual void monitor_datarefs(const std::vector<DatarefKey> &keys, bool on) = 0;
    virtual void monitor_command(const std::string &path, bool on) = 0;
};

class Dataref
{
public:
    /// `name` is a path, optionally with an element suffix: "sim/some/values[4]"
    Dataref(std::weak_ptr<EntityBackend> backend, const std::string &name, bool auto_save = false);
    ~Dataref();

    Dataref(const Dataref &) = delete;
    Dataref &operator=(const Dataref &) = delete;

    const std::string &path() const { return key_.path; }
    std::optional<int> index() const { return key_.index; }
    const DatarefKey &key() const { return key_; }
    std::string name() const { return to_string(key_); }

    std::shared_ptr<const DatarefMeta> meta();
    bool valid();
    int64_t id() { return meta()->id; }
    bool is_writable() { return meta()->is_writable; }
    bool is_array() { return meta()->is_array() && !key_.index; }

    // Shape of value(): an element of an array is a scalar.
    ValueKind kind();

    /**
     * Pending write value if any, else the last value pushed over the WebSocket,
     * else a REST read.
     * @throws NotConnected, UnknownPath, TransportError, DecodeError
     */
    Value value();

    // Stores the pending value; written at once when auto_save is on.
    void set_value(Value v);
    bool has_pending() const;
    void clear_pending();

    /**
     * Sends the pending value, or the kind's default (0, "") when none is set.
     * @throws NotWritable, ContractError for an array without a pending value
     */
    void write();

    void monitor();
    // Returns whether this handle is still monitored.
    bool unmonitor();
    bool is_monitored() const { return monitored_.load() > 0; }
    unsigned monitored_count() const { return monitored_.load(); }

    // Instance count only; used by bulk monitoring that talks to the table itself.
    void inc_monitor() { ++monitored_; }
    bool dec_monitor();

    bool auto_save;

private:
    std::shared_ptr<EntityBackend> backend() const;

    std::weak_ptr<EntityBackend> backend_;
    DatarefKey key_;
    std::atomic<unsigned> monitored_{0};

    mutable std::mutex m_;
    std::shared_ptr<const DatarefMeta> meta_;
    uint64_t meta_epoch_{0};
    std::optional<Value> pending_;
    std::optional<Value> cached_;
};

class Command
{
public:
    Command(std::weak_ptr<EntityBackend> backend, std::string path, double duration = 0.0);
    ~Command();

    Command(const Command &) = delete;
    Command &operator=(const Command &) = delete;

    const std::string &path() const { return path_; }

    std::shared_ptr<const CommandMeta> meta();
    bool valid();
    int64_t id() { return meta()->id; }
    std::string description() { return meta()->description; }

    void execute() { execute(duration); }
    void execute(double duration_s);

    void monitor();
    bool unmonitor();
    unsigned monitored_count() const { return monitored_.load(); }

    double duration;

private:
    std::shared_ptr<EntityBackend> backend() const;

    std::weak_ptr<EntityBackend> backend_;
    std::string path_;
    std::atomic<unsigned> monitored_{0};

    std::mutex m_;
    std::shared_ptr<const CommandMeta> meta_;
    uint64_t meta_epoch_{0};
};

} // namespace xplink
