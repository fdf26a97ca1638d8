/*
 * File: src/metadata_cache.cpp
 * Project: XPLink
 * Purpose: Name <-> identifier tables for datarefs and commands
 * Last updated: 2026-10-19
 */

#include "xplink/metadata_cache.hpp"
#include "xplink/atomic_write.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"

namespace xplink
{

using nlohmann::json;

namespace
{

void require_fields(const json &j)
{
    if (!j.is_object() || !j.contains("name") || !j.contains("id"))
        throw DecodeError("metadata entry without name or id: " + j.dump());
}

template <typename Meta, typename Parse>
MetaTable<Meta> build_table(const json &raw, Parse parse, const char *what)
{
    if (!raw.is_array())
        throw DecodeError(std::string(what) + " table is not an array");
    std::vector<Meta> metas;
    metas.reserve(raw.size());
    std::size_t skipped = 0;
    for (const auto &e : raw)
    {
        try
        {
            metas.push_back(parse(e));
        }
        catch (const DecodeError &ex)
        {
            if (skipped++ == 0)
                XPLINK_LOG_WARN("{}: {}", what, ex.what());
        }
    }
    if (skipped > 0)
        XPLINK_LOG_WARN("{}: {} malformed entries skipped", what, skipped);
    return MetaTable<Meta>(std::move(metas), raw);
}

} // namespace

DatarefMeta dataref_meta_from_json(const json &j)
{
    require_fields(j);
    DatarefMeta m;
    m.name = j.at("name").get<std::string>();
    m.id = j.at("id").get<int64_t>();
    m.value_type = j.value("value_type", std::string("double"));
    m.kind = kind_from_type(m.value_type);
    m.is_writable = j.value("is_writable", false);
    return m;
}

CommandMeta command_meta_from_json(const json &j)
{
    require_fields(j);
    CommandMeta m;
    m.name = j.at("name").get<std::string>();
    m.id = j.at("id").get<int64_t>();
    m.description = j.value("description", std::string());
    return m;
}

MetadataCache::MetadataCache(std::chrono::seconds min_reload_interval)
    : min_interval_(min_reload_interval), snap_(std::make_shared<Snapshot>())
{
}

MetadataCache::ReloadResult MetadataCache::reload(MetadataSource &source, bool force)
{
    std::scoped_lock reload_lk(reload_m_);

    std::optional<double> last;
    {
        std::scoped_lock lk(m_);
        last = last_uptime_;
    }
    if (!force && last)
    {
        auto now = source.uptime();
        if (now)
        {
            double elapsed = *now - *last;
            if (elapsed >= 0 && elapsed < static_cast<double>(min_interval_.count()))
            {
                XPLINK_LOG_INFO("metadata cache not reloaded, reloaded {:.1f} secs. ago", elapsed);
                return ReloadResult::Skipped;
            }
        }
        else
        {
            XPLINK_LOG_WARN("no simulator uptime, reloading metadata cache");
        }
    }

    auto next = std::make_shared<Snapshot>();
    try
    {
        next->datarefs = build_table<DatarefMeta>(source.fetch_datarefs(), dataref_meta_from_json, "datarefs");
        if (source.supports_commands())
            next->commands = build_table<CommandMeta>(source.fetch_commands(), command_meta_from_json, "commands");
    }
    catch (const Error &e)
    {
        XPLINK_LOG_ERROR("metadata reload failed: {}", e.what());
        return ReloadResult::Failed;
    }
    catch (const json::exception &e)
    {
        XPLINK_LOG_ERROR("metadata reload failed: {}", e.what());
        return ReloadResult::Failed;
    }

    auto uptime = source.uptime();
    {
        std::scoped_lock lk(m_);
        snap_ = next;
        last_uptime_ = uptime ? uptime : std::optional<double>(0.0);
        epoch_.fetch_add(1);
    }
    if (!uptime)
        XPLINK_LOG_WARN("no simulator uptime after reload");
    XPLINK_LOG_INFO("dataref cache ({}) and command cache ({}) reloaded, sim uptime {:.0f}s",
                    next->datarefs.size(), next->commands.size(), uptime.value_or(0.0));
    return ReloadResult::Reloaded;
}

std::shared_ptr<const MetadataCache::Snapshot> MetadataCache::snapshot() const
{
    std::scoped_lock lk(m_);
    return snap_;
}

std::shared_ptr<const DatarefMeta> MetadataCache::dataref(const std::string &name) const
{
    return snapshot()->datarefs.find(name);
}

std::shared_ptr<const DatarefMeta> MetadataCache::dataref(int64_t id) const
{
    return snapshot()->datarefs.find(id);
}

std::shared_ptr<const CommandMeta> MetadataCache::command(const std::string &name) const
{
    return snapshot()->commands.find(name);
}

std::shared_ptr<const CommandMeta> MetadataCache::command(int64_t id) const
{
    return snapshot()->commands.find(id);
}

std::string MetadataCache::equiv(int64_t dataref_id) const
{
    return snapshot()->datarefs.equiv(dataref_id);
}

std::string MetadataCache::command_equiv(int64_t command_id) const
{
    return snapshot()->commands.equiv(command_id);
}

void MetadataCache::invalidate()
{
    std::scoped_lock lk(m_);
    snap_ = std::make_shared<Snapshot>();
    last_uptime_.reset();
    epoch_.fetch_add(1);
}

bool MetadataCache::has_data() const
{
    auto s = snapshot();
    return !s->datarefs.empty() || !s->commands.empty();
}

std::size_t MetadataCache::dataref_count() const { return snapshot()->datarefs.size(); }

std::size_t MetadataCache::command_count() const { return snapshot()->commands.size(); }

std::optional<double> MetadataCache::last_reload_uptime() const
{
    std::scoped_lock lk(m_);
    return last_uptime_;
}

void MetadataCache::save(const std::string &prefix) const
{
    auto s = snapshot();
    write_atomic(prefix + "-datarefs.json", s->datarefs.raw().dump());
    write_atomic(prefix + "-commands.json", s->commands.raw().dump());
    XPLINK_LOG_DEBUG("metadata saved under {}-*.json", prefix);
}

} // namespace xplink
