/*
 * File: src/ws_frames.cpp
 * Project: XPLink
 * Purpose: WebSocket JSON envelope, outbound builders and inbound parser
 * Last updated: 2026-10-19
 */

#include "xplink/ws_frames.hpp"
#include "xplink/errors.hpp"

namespace xplink
{

using nlohmann::json;

namespace
{

json envelope(const char *type, json params)
{
    return json{{"type", type}, {"params", std::move(params)}};
}

int64_t parse_ident(const std::string &key)
{
    std::size_t used = 0;
    int64_t id = 0;
    try
    {
        id = std::stoll(key, &used);
    }
    catch (const std::exception &)
    {
        throw DecodeError("non numeric identifier '" + key + "'");
    }
    if (used != key.size())
        throw DecodeError("non numeric identifier '" + key + "'");
    return id;
}

const json &data_object(const json &j)
{
    auto it = j.find("data");
    if (it == j.end() || !it->is_object())
        throw DecodeError("frame without data object: " + j.dump());
    return *it;
}

std::string field_text(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // namespace

json dataref_subscription_frame(const std::vector<DatarefRequest> &refs, bool subscribe)
{
    json list = json::array();
    for (const auto &r : refs)
    {
        json e{{"id", r.id}};
        if (!r.indices.empty())
            e["index"] = r.indices;
        list.push_back(std::move(e));
    }
    return envelope(subscribe ? frame::kDatarefSubscribe : frame::kDatarefUnsubscribe,
                    json{{"datarefs", std::move(list)}});
}

json command_subscription_frame(const std::vector<int64_t> &ids, bool subscribe)
{
    json list = json::array();
    for (auto id : ids)
        list.push_back(json{{"id", id}});
    return envelope(subscribe ? frame::kCommandSubscribe : frame::kCommandUnsubscribe,
                    json{{"commands", std::move(list)}});
}

json dataref_set_frame(int64_t id, const json &value, std::optional<int> index)
{
    json e{{"id", id}, {"value", value}};
    if (index)
        e["index"] = *index;
    return envelope(frame::kDatarefSet, json{{"datarefs", json::array({e})}});
}

json command_set_active_frame(int64_t id, bool active, std::optional<double> duration)
{
    json e{{"id", id}, {"is_active", active}};
    if (duration)
        e["duration"] = *duration;
    return envelope(frame::kCommandSetActive, json{{"commands", json::array({e})}});
}

std::string tag_frame(json f, uint64_t req_id)
{
    f["req_id"] = req_id;
    return f.dump();
}

InboundFrame parse_frame(const std::string &text)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw DecodeError("frame is not a JSON object");
    auto t = j.find("type");
    if (t == j.end() || !t->is_string())
        throw DecodeError("frame without type: " + text);
    const std::string type = t->get<std::string>();

    if (type == frame::kResult)
    {
        auto r = j.find("req_id");
        if (r == j.end() || !r->is_number_integer())
            throw DecodeError("result without req_id: " + text);
        ResultFrame out;
        out.req_id = r->get<uint64_t>();
        out.success = j.value("success", false);
        out.error_code = field_text(j, "error_code");
        out.error_message = field_text(j, "error_message");
        return out;
    }

    if (type == frame::kDatarefUpdate)
    {
        DatarefUpdateFrame out;
        for (const auto &[key, value] : data_object(j).items())
            out.values.emplace_back(parse_ident(key), value);
        return out;
    }

    if (type == frame::kCommandActive)
    {
        CommandActiveFrame out;
        for (const auto &[key, value] : data_object(j).items())
        {
            if (!value.is_boolean())
                throw DecodeError("command active value is not a boolean: " + value.dump());
            out.values.emplace_back(parse_ident(key), value.get<bool>());
        }
        return out;
    }

    return UnknownFrame{type, std::move(j)};
}

} // namespace xplink
