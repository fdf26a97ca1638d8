/*
 * File: tests/test_rest_api.cpp
 * Project: XPLink
 * Purpose: REST endpoints, capabilities and version selection
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>

#include "fakes.hpp"
#include "xplink/errors.hpp"
#include "xplink/rest_api.hpp"

using namespace xplink;
using namespace xplink_test;

namespace
{

const json kCaps = json::parse(R"({"api":{"versions":["v1","v2","v10"]},"x-plane":{"version":"12.1.4-r2"}})");

struct Fixture
{
    Fixture() { http.route("GET", "/api/capabilities", kCaps); }

    ClientConfig cfg;
    FakeHttpClient http;
    RestApi rest{http, cfg};
};

} // namespace

TEST_CASE("reachability probe")
{
    Fixture f;
    REQUIRE_FALSE(f.rest.reachable());
    f.http.route("GET", "/api/v1/datarefs/count", json{{"data", 4000}});
    REQUIRE(f.rest.reachable());
    f.http.down = true;
    REQUIRE_FALSE(f.rest.reachable());
}

TEST_CASE("newest version by natural order unless one is requested")
{
    Fixture f;
    REQUIRE(f.rest.set_api_version() == "v10");
    REQUIRE(f.rest.versioned_root() == "/api/v10");
    REQUIRE(f.rest.set_api_version("v2") == "v2");
    REQUIRE(f.rest.api_version() == "v2");
    REQUIRE(f.rest.set_api_version("v9") == "v10");
    REQUIRE(*f.rest.simulator_version() == "12.1.4-r2");
}

TEST_CASE("capabilities are fetched once per connection")
{
    Fixture f;
    f.rest.capabilities();
    f.rest.set_api_version();
    f.rest.simulator_version();
    REQUIRE(f.http.count("GET", "/api/capabilities") == 1);
    f.rest.reset_connection();
    f.rest.capabilities();
    REQUIRE(f.http.count("GET", "/api/capabilities") == 2);
}

TEST_CASE("servers without capabilities get the v1 set")
{
    ClientConfig cfg;
    FakeHttpClient http;
    RestApi rest(http, cfg);
    REQUIRE(rest.capabilities() == v1_capabilities());
    REQUIRE(rest.set_api_version() == "v1");
    REQUIRE_FALSE(rest.supports_commands());
    REQUIRE(*rest.simulator_version() == "12.1.1");
}

TEST_CASE("commands need api v2")
{
    Fixture f;
    f.rest.set_api_version("v1");
    REQUIRE_FALSE(f.rest.supports_commands());
    f.rest.set_api_version("v2");
    REQUIRE(f.rest.supports_commands());
    f.rest.set_api_version("v10");
    REQUIRE(f.rest.supports_commands());
}

TEST_CASE("lookup by name uses an encoded filter")
{
    Fixture f;
    f.rest.set_api_version("v2");
    f.http.route("GET", "/api/v2/datarefs?filter%5Bname%5D=sim%2Fcockpit%2Fpressure",
                 json{{"data", json::array({dataref_entry(77, "sim/cockpit/pressure", "float", true)})}});
    auto m = f.rest.dataref_meta_by_name("sim/cockpit/pressure");
    REQUIRE(m);
    REQUIRE(m->id == 77);
    REQUIRE(m->is_writable);

    REQUIRE_FALSE(f.rest.dataref_meta_by_name("sim/not/there"));

    f.http.route("GET", "/api/v2/commands?filter%5Bname%5D=sim%2Foperation%2Fpause_toggle",
                 json{{"data", json::array({command_entry(7, "sim/operation/pause_toggle", "Pause")})}});
    REQUIRE(f.rest.command_meta_by_name("sim/operation/pause_toggle")->description == "Pause");

    f.http.down = true;
    REQUIRE_THROWS_AS(f.rest.dataref_meta_by_name("sim/cockpit/pressure"), TransportError);
}

TEST_CASE("value read and write")
{
    Fixture f;
    f.rest.set_api_version("v2");
    f.http.route("GET", "/api/v2/datarefs/77/value", json{{"data", 29.92}});
    REQUIRE(f.rest.dataref_value(77) == 29.92);
    REQUIRE_THROWS_AS(f.rest.dataref_value(78), TransportError);

    f.http.route("PATCH", "/api/v2/datarefs/42/value?index=3", json{{"data", 0}});
    f.rest.write_dataref_value(42, 12, 3);
    const auto &req = f.http.requests.back();
    REQUIRE(req.verb == "PATCH");
    REQUIRE(json::parse(req.body) == json{{"data", 12}});

    REQUIRE_THROWS_AS(f.rest.write_dataref_value(42, 12, std::nullopt), TransportError);
}

TEST_CASE("command activation")
{
    Fixture f;
    f.rest.set_api_version("v2");
    f.http.route("POST", "/api/v2/command/7/activate", json::object());
    f.rest.activate_command(7, 0.5);
    REQUIRE(json::parse(f.http.requests.back().body) == json{{"id", 7}, {"duration", 0.5}});
    REQUIRE_THROWS_AS(f.rest.activate_command(8, 0.0), TransportError);
}

TEST_CASE("uptime resolves its dataref once")
{
    Fixture f;
    f.rest.set_api_version("v2");
    f.http.route("GET", "/api/v2/datarefs?filter%5Bname%5D=sim%2Ftime%2Ftotal_running_time_sec",
                 json{{"data", json::array({dataref_entry(60, "sim/time/total_running_time_sec", "float")})}});
    f.http.route("GET", "/api/v2/datarefs/60/value", json{{"data", 1234.5}});
    REQUIRE(f.rest.uptime() == 1234.5);
    REQUIRE(f.rest.uptime() == 1234.5);
    REQUIRE(f.http.count("GET", "/api/v2/datarefs?filter%5Bname%5D=sim%2Ftime%2Ftotal_running_time_sec") == 1);

    f.http.down = true;
    REQUIRE_FALSE(f.rest.uptime());
}

TEST_CASE("full tables feed the metadata cache")
{
    Fixture f;
    f.rest.set_api_version("v2");
    auto src = standard_source();
    f.http.route("GET", "/api/v2/datarefs", json{{"data", src.datarefs}});
    f.http.route("GET", "/api/v2/commands", json{{"data", src.commands}});

    MetadataCache cache;
    REQUIRE(cache.reload(f.rest) == MetadataCache::ReloadResult::Reloaded);
    REQUIRE(cache.dataref_count() == 5);
    REQUIRE(cache.command_count() == 2);
}

TEST_CASE("endpoint change forgets the previous simulator")
{
    Fixture f;
    f.rest.capabilities();
    f.rest.set_endpoint("10.0.0.7", 8086);
    REQUIRE(f.rest.host() == "10.0.0.7");
    f.rest.capabilities();
    REQUIRE(f.http.count("GET", "/api/capabilities") == 2);
    REQUIRE(f.http.requests.back().host == "10.0.0.7");
}

TEST_CASE("url encoding")
{
    REQUIRE(url_encode("sim/a b[1]") == "sim%2Fa%20b%5B1%5D");
    REQUIRE(url_encode("A-z_0.~") == "A-z_0.~");
}
