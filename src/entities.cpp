/*
 * File: src/entities.cpp
 * Project: XPLink
 * Purpose: Dataref and Command handles used by applications
 * Last updated: 2026-10-19
 */

#include "xplink/entities.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"

namespace xplink
{

Dataref::Dataref(std::weak_ptr<EntityBackend> backend, const std::string &name, bool auto_save)
    : auto_save(auto_save), backend_(std::move(backend)), key_(parse_dataref_name(name))
{
}

Dataref::~Dataref()
{
    const unsigned n = monitored_.exchange(0);
    if (n == 0)
        return;
    auto b = backend_.lock();
    if (!b)
        return;
    try
    {
        b->monitor_datarefs(std::vector<DatarefKey>(n, key_), false);
    }
    catch (const std::exception &e)
    {
        XPLINK_LOG_WARN("{}: release of {} subscription(s) failed: {}", name(), n, e.what());
    }
}

std::shared_ptr<EntityBackend> Dataref::backend() const
{
    auto b = backend_.lock();
    if (!b)
        throw NotConnected();
    return b;
}

std::shared_ptr<const DatarefMeta> Dataref::meta()
{
    auto b = backend();
    const uint64_t epoch = b->metadata_epoch();
    {
        std::scoped_lock lk(m_);
        if (meta_ && meta_epoch_ == epoch)
            return meta_;
    }
    auto m = b->dataref_meta(key_.path);
    std::scoped_lock lk(m_);
    meta_ = m;
    meta_epoch_ = epoch;
    return meta_;
}

bool Dataref::valid()
{
    try
    {
        return meta() != nullptr;
    }
    catch (const ContractError &e)
    {
        XPLINK_LOG_DEBUG("dataref {} not valid: {}", name(), e.what());
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_DEBUG("dataref {} not valid: {}", name(), e.what());
    }
    return false;
}

ValueKind Dataref::kind()
{
    auto m = meta();
    return key_.index && m->is_array() ? ValueKind::Scalar : m->kind;
}

Value Dataref::value()
{
    {
        std::scoped_lock lk(m_);
        if (pending_)
            return *pending_;
    }

    auto b = backend();
    if (auto pushed = b->monitored_value(key_))
    {
        std::scoped_lock lk(m_);
        cached_ = *pushed;
        return *pushed;
    }

    auto m = meta();
    nlohmann::json raw = b->fetch_value(*m);
    if (key_.index)
    {
        if (!raw.is_array() || *key_.index < 0 || static_cast<std::size_t>(*key_.index) >= raw.size())
            throw DecodeError("dataref " + name() + ": index out of range in " + raw.dump());
        raw = raw[static_cast<std::size_t>(*key_.index)];
    }
    auto v = decode_value(kind(), raw);
    if (!v)
        throw DecodeError("dataref " + name() + ": unexpected value " + raw.dump() + " for " + m->value_type);

    std::scoped_lock lk(m_);
    cached_ = *v;
    return *v;
}

void Dataref::set_value(Value v)
{
    {
        std::scoped_lock lk(m_);
        pending_ = std::move(v);
    }
    if (auto_save)
        write();
}

bool Dataref::has_pending() const
{
    std::scoped_lock lk(m_);
    return pending_.has_value();
}

void Dataref::clear_pending()
{
    std::scoped_lock lk(m_);
    pending_.reset();
}

void Dataref::write()
{
    auto m = meta();
    if (!m->is_writable)
        throw NotWritable(name());

    const ValueKind k = kind();
    std::optional<Value> pending;
    {
        std::scoped_lock lk(m_);
        pending = pending_;
    }
    Value v = pending ? *pending : default_value(k);

    backend()->write_value(*m, key_.index, encode_value(k, v));

    std::scoped_lock lk(m_);
    cached_ = v;
    pending_.reset();
}

void Dataref::monitor()
{
    auto b = backend();
    inc_monitor();
    b->monitor_datarefs({key_}, true);
}

bool Dataref::dec_monitor()
{
    unsigned cur = monitored_.load();
    while (cur > 0 && !monitored_.compare_exchange_weak(cur, cur - 1))
    {
    }
    if (cur == 0)
    {
        XPLINK_LOG_WARN("{} currently not monitored", name());
        return false;
    }
    return true;
}

bool Dataref::unmonitor()
{
    auto b = backend();
    if (dec_monitor())
        b->monitor_datarefs({key_}, false);
    return is_monitored();
}

Command::Command(std::weak_ptr<EntityBackend> backend, std::string path, double duration)
    : duration(duration), backend_(std::move(backend)), path_(std::move(path))
{
    if (path_.empty())
        throw ContractError("empty command path");
}

Command::~Command()
{
    unsigned n = monitored_.exchange(0);
    auto b = n ? backend_.lock() : nullptr;
    try
    {
        for (; b && n > 0; --n)
            b->monitor_command(path_, false);
    }
    catch (const std::exception &e)
    {
        XPLINK_LOG_WARN("command {}: release of monitoring failed: {}", path_, e.what());
    }
}

std::shared_ptr<EntityBackend> Command::backend() const
{
    auto b = backend_.lock();
    if (!b)
        throw NotConnected();
    return b;
}

std::shared_ptr<const CommandMeta> Command::meta()
{
    auto b = backend();
    const uint64_t epoch = b->metadata_epoch();
    {
        std::scoped_lock lk(m_);
        if (meta_ && meta_epoch_ == epoch)
            return meta_;
    }
    auto m = b->command_meta(path_);
    std::scoped_lock lk(m_);
    meta_ = m;
    meta_epoch_ = epoch;
    return meta_;
}

bool Command::valid()
{
    try
    {
        return meta() != nullptr;
    }
    catch (const ContractError &e)
    {
        XPLINK_LOG_DEBUG("command {} not valid: {}", path_, e.what());
    }
    catch (const TransportError &e)
    {
        XPLINK_LOG_DEBUG("command {} not valid: {}", path_, e.what());
    }
    return false;
}

void Command::execute(double duration_s)
{
    backend()->execute_command(*meta(), duration_s);
}

void Command::monitor()
{
    auto b = backend();
    ++monitored_;
    b->monitor_command(path_, true);
}

bool Command::unmonitor()
{
    auto b = backend();
    unsigned cur = monitored_.load();
    while (cur > 0 && !monitored_.compare_exchange_weak(cur, cur - 1))
    {
    }
    if (cur == 0)
    {
        XPLINK_LOG_WARN("command {} currently not monitored", path_);
        return false;
    }
    b->monitor_command(path_, false);
    return monitored_.load() > 0;
}

} // namespace xplink
