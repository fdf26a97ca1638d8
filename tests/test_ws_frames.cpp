/*
 * File: tests/test_ws_frames.cpp
 * Project: XPLink
 * Purpose: WebSocket request builders and inbound frame parsing
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>

#include "xplink/errors.hpp"
#include "xplink/ws_frames.hpp"

using namespace xplink;
using nlohmann::json;

TEST_CASE("bulk dataref subscription lists whole values and element indices")
{
    auto f = dataref_subscription_frame({{11, {}}, {42, {3, 7}}}, true);
    REQUIRE(f["type"] == "dataref_subscribe_values");
    auto list = f["params"]["datarefs"];
    REQUIRE(list.size() == 2);
    REQUIRE(list[0] == json{{"id", 11}});
    REQUIRE(list[1]["id"] == 42);
    REQUIRE(list[1]["index"] == json::array({3, 7}));

    REQUIRE(dataref_subscription_frame({{11, {}}}, false)["type"] == "dataref_unsubscribe_values");
}

TEST_CASE("command frames")
{
    auto sub = command_subscription_frame({7, 8}, true);
    REQUIRE(sub["type"] == "command_subscribe_is_active");
    REQUIRE(sub["params"]["commands"].size() == 2);
    REQUIRE(command_subscription_frame({7}, false)["type"] == "command_unsubscribe_is_active");

    auto act = command_set_active_frame(7, true, 1.5);
    REQUIRE(act["type"] == "command_set_is_active");
    REQUIRE(act["params"]["commands"][0] == json{{"id", 7}, {"is_active", true}, {"duration", 1.5}});
    REQUIRE_FALSE(command_set_active_frame(7, false)["params"]["commands"][0].contains("duration"));
}

TEST_CASE("dataref set frame carries the element index only when given")
{
    auto whole = dataref_set_frame(11, 2.5);
    REQUIRE(whole["type"] == "dataref_set_values");
    REQUIRE(whole["params"]["datarefs"][0] == json{{"id", 11}, {"value", 2.5}});

    auto element = dataref_set_frame(42, 9, 3);
    REQUIRE(element["params"]["datarefs"][0]["index"] == 3);
}

TEST_CASE("tag_frame adds req_id")
{
    auto text = tag_frame(command_subscription_frame({7}, true), 17);
    auto j = json::parse(text);
    REQUIRE(j["req_id"] == 17);
    REQUIRE(j["type"] == "command_subscribe_is_active");
}

TEST_CASE("result frames")
{
    auto ok = parse_frame(R"({"type":"result","req_id":3,"success":true})");
    REQUIRE(std::holds_alternative<ResultFrame>(ok));
    REQUIRE(std::get<ResultFrame>(ok).req_id == 3);
    REQUIRE(std::get<ResultFrame>(ok).success);

    auto bad = std::get<ResultFrame>(
        parse_frame(R"({"type":"result","req_id":4,"success":false,"error_code":"invalid_id","error_message":"no 99"})"));
    REQUIRE_FALSE(bad.success);
    REQUIRE(bad.error_code == "invalid_id");
    REQUIRE(bad.error_message == "no 99");

    REQUIRE_THROWS_AS(parse_frame(R"({"type":"result","success":true})"), DecodeError);
}

TEST_CASE("update frames are keyed by numeric identifier")
{
    auto f = parse_frame(R"({"type":"dataref_update_values","data":{"11":2.5,"42":[10,20]}})");
    const auto &u = std::get<DatarefUpdateFrame>(f);
    REQUIRE(u.values.size() == 2);
    REQUIRE(u.values[0].first == 11);
    REQUIRE(u.values[0].second == 2.5);
    REQUIRE(u.values[1].second == json::array({10, 20}));

    auto c = std::get<CommandActiveFrame>(parse_frame(R"({"type":"command_update_is_active","data":{"7":true}})"));
    REQUIRE(c.values.size() == 1);
    REQUIRE(c.values[0] == std::make_pair(int64_t{7}, true));

    REQUIRE_THROWS_AS(parse_frame(R"({"type":"dataref_update_values","data":{"x1":1}})"), DecodeError);
    REQUIRE_THROWS_AS(parse_frame(R"({"type":"command_update_is_active","data":{"7":1}})"), DecodeError);
    REQUIRE_THROWS_AS(parse_frame(R"({"type":"dataref_update_values"})"), DecodeError);
}

TEST_CASE("malformed and unknown frames")
{
    REQUIRE_THROWS_AS(parse_frame("not json"), DecodeError);
    REQUIRE_THROWS_AS(parse_frame("[1,2]"), DecodeError);
    REQUIRE_THROWS_AS(parse_frame(R"({"data":{}})"), DecodeError);

    auto f = parse_frame(R"({"type":"something_new","data":1})");
    REQUIRE(std::get<UnknownFrame>(f).type == "something_new");
}
