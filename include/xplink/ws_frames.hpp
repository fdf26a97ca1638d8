/*
 * File: include/xplink/ws_frames.hpp
 * Project: XPLink
 * Purpose: WebSocket JSON envelope, outbound builders and inbound parser
 * Notes:
 *  - outbound: {"type", "req_id", "params"}; req_id is stamped by the Dispatcher
 *  - array element subscriptions use the "index" key
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace xplink
{

namespace frame
{
constexpr const char *kResult = "result";
constexpr const char *kDatarefUpdate = "dataref_update_values";
constexpr const char *kCommandActive = "command_update_is_active";

constexpr const char *kDatarefSubscribe = "dataref_subscribe_values";
constexpr const char *kDatarefUnsubscribe = "dataref_unsubscribe_values";
constexpr const char *kDatarefSet = "dataref_set_values";
constexpr const char *kCommandSubscribe = "command_subscribe_is_active";
constexpr const char *kCommandUnsubscribe = "command_unsubscribe_is_active";
constexpr const char *kCommandSetActive = "command_set_is_active";
} // namespace frame

// One entry of a bulk dataref request. Empty indices means the whole value.
struct DatarefRequest
{
    int64_t id{0};
    std::vector<int> indices;
};

nlohmann::json dataref_subscription_frame(const std::vector<DatarefRequest> &refs, bool subscribe);
nlohmann::json command_subscription_frame(const std::vector<int64_t> &ids, bool subscribe);
nlohmann::json dataref_set_frame(int64_t id, const nlohmann::json &value, std::optional<int> index = std::nullopt);
nlohmann::json command_set_active_frame(int64_t id, bool active, std::optional<double> duration = std::nullopt);

// Adds req_id and serializes.
std::string tag_frame(nlohmann::json frame, uint64_t req_id);

struct ResultFrame
{
    uint64_t req_id{0};
    bool success{false};
    std::string error_code;
    std::string error_message;
};

struct DatarefUpdateFrame
{
    std::vector<std::pair<int64_t, nlohmann::json>> values;
};

struct CommandActiveFrame
{
    std::vector<std::pair<int64_t, bool>> values;
};

struct UnknownFrame
{
    std::string type;
    nlohmann::json body;
};

using InboundFrame = std::variant<ResultFrame, DatarefUpdateFrame, CommandActiveFrame, UnknownFrame>;

/// @throws DecodeError on invalid JSON, missing "type" or malformed "data"
InboundFrame parse_frame(const std::string &text);

} // namespace xplink
