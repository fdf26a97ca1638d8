/*
 * File: tests/test_client.cpp
 * Project: XPLink
 * Purpose: Client facade end to end over in-memory transports
 * Notes:
 *  - the connection monitor is stepped by hand; the listener runs on its own thread
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>

#include <atomic>

#include "fakes.hpp"
#include "xplink/client.hpp"
#include "xplink/errors.hpp"

using namespace xplink;
using namespace xplink_test;

namespace
{

ClientConfig test_config()
{
    ClientConfig cfg;
    cfg.receive_timeout_searching = std::chrono::milliseconds(20);
    cfg.receive_timeout_steady = std::chrono::milliseconds(20);
    cfg.join_timeout = std::chrono::milliseconds(2000);
    return cfg;
}

struct Fixture
{
    explicit Fixture(ClientConfig cfg = test_config(), bool with_beacon = false)
    {
        auto h = std::make_unique<FakeHttpClient>();
        auto w = std::make_unique<FakeWsChannel>();
        std::unique_ptr<FakeBeaconSocket> b;
        if (with_beacon)
            b = std::make_unique<FakeBeaconSocket>();
        http = h.get();
        ws = w.get();
        beacon_socket = b.get();
        route_simulator(*http);
        client = std::make_unique<Client>(cfg, std::move(h), std::move(w), std::move(b));

        client->events().dataref_update.add([this](const DatarefUpdate &u)
                                            {
            std::scoped_lock lk(m);
            updates.push_back(u); });
        client->events().close.add([this]
                                   { ++closes; });
    }

    // the client goes first: its threads and close event still use the members below
    ~Fixture() { client.reset(); }

    static void route_simulator(FakeHttpClient &http)
    {
        auto src = standard_source();
        http.route("GET", "/api/v1/datarefs/count", json{{"data", 5}});
        http.route("GET", "/api/capabilities",
                   json::parse(R"({"api":{"versions":["v1","v2"]},"x-plane":{"version":"12.1.4"}})"));
        http.route("GET", "/api/v2/datarefs", json{{"data", src.datarefs}});
        http.route("GET", "/api/v2/commands", json{{"data", src.commands}});
        http.route("GET", "/api/v2/datarefs?filter%5Bname%5D=sim%2Ftime%2Ftotal_running_time_sec",
                   json{{"data", json::array({src.datarefs[4]})}});
        http.route("GET", "/api/v2/datarefs/60/value", json{{"data", 321.0}});
        http.route("GET", "/api/v2/datarefs/11/value", json{{"data", 1.25}});
    }

    void connect()
    {
        client->connection().step();
        REQUIRE(client->connected());
        ws->clear_sent();
    }

    std::size_t update_count()
    {
        std::scoped_lock lk(m);
        return updates.size();
    }

    FakeHttpClient *http{nullptr};
    FakeWsChannel *ws{nullptr};
    FakeBeaconSocket *beacon_socket{nullptr};
    std::unique_ptr<Client> client;

    std::mutex m;
    std::vector<DatarefUpdate> updates;
    std::atomic<int> closes{0};
};

} // namespace

TEST_CASE("connecting selects the api, loads metadata and starts listening")
{
    Fixture f;
    f.connect();
    REQUIRE(f.client->rest().api_version() == "v2");
    REQUIRE(f.ws->last_target == "/api/v2");
    REQUIRE(f.client->cache().dataref_count() == 5);
    REQUIRE(f.client->cache().command_count() == 2);
    REQUIRE(f.client->listener().running());
    REQUIRE(f.client->state() == ConnectionState::Listening);
    REQUIRE(f.client->wait_connection(std::chrono::milliseconds(10)));
    REQUIRE(f.client->uptime() == 321.0);
}

TEST_CASE("two handles on sim/x: the wire follows the last one")
{
    Fixture f;
    f.connect();
    auto a = f.client->dataref("sim/x");
    auto b = f.client->dataref("sim/x");
    f.client->monitor(*a);
    f.client->monitor(*b);
    REQUIRE(f.ws->sent("dataref_subscribe_values").size() == 1);

    REQUIRE_FALSE(f.client->unmonitor(*a));
    REQUIRE(f.ws->sent("dataref_unsubscribe_values").empty());
    REQUIRE(f.client->subscriptions().ref_count(key("sim/x")) == 1);

    f.client->unmonitor(*b);
    REQUIRE(f.ws->sent("dataref_unsubscribe_values").size() == 1);
}

TEST_CASE("a dropped monitored handle gives its subscription back")
{
    Fixture f;
    f.connect();
    auto keep = f.client->dataref("sim/arr[3]");
    keep->monitor();
    {
        auto d = f.client->dataref("sim/x");
        d->monitor();
        auto e = f.client->dataref("sim/arr[3]");
        e->monitor();
        REQUIRE(f.client->subscriptions().ref_count(key("sim/x")) == 1);
        REQUIRE(f.client->subscriptions().ref_count(key("sim/arr[3]")) == 2);
    }
    REQUIRE(f.client->subscriptions().ref_count(key("sim/x")) == 0);
    REQUIRE(f.client->subscriptions().ref_count(key("sim/arr[3]")) == 1);
    auto unsub = f.ws->sent("dataref_unsubscribe_values");
    REQUIRE(unsub.size() == 1);
    REQUIRE(unsub[0]["params"]["datarefs"] == json::array({json{{"id", 11}}}));
}

TEST_CASE("handles kept past the client fail cleanly")
{
    std::shared_ptr<Dataref> d;
    std::shared_ptr<Command> c;
    {
        Fixture f;
        f.connect();
        d = f.client->dataref("sim/x");
        c = f.client->command("sim/operation/pause_toggle");
        d->monitor();
    }
    REQUIRE_THROWS_AS(d->value(), NotConnected);
    REQUIRE_THROWS_AS(c->execute(), NotConnected);
    d.reset();
}

TEST_CASE("pushed array elements reach callbacks and handles")
{
    Fixture f;
    f.connect();
    auto e3 = f.client->dataref("sim/arr[3]");
    auto e7 = f.client->dataref("sim/arr[7]");
    f.client->monitor({e3, e7});
    auto sub = f.ws->sent("dataref_subscribe_values");
    REQUIRE(sub.size() == 1);
    REQUIRE(sub[0]["params"]["datarefs"][0]["index"] == json::array({3, 7}));

    f.ws->push(json{{"type", "dataref_update_values"}, {"data", {{"42", {10, 20}}}}});
    REQUIRE(eventually([&]
                       { return f.update_count() == 2; }));
    REQUIRE(std::get<double>(e3->value()) == 10.0);
    REQUIRE(std::get<double>(e7->value()) == 20.0);
    REQUIRE(f.client->state() == ConnectionState::Receiving);

    f.client->unmonitor({e3, e7});
    REQUIRE(f.ws->sent("dataref_unsubscribe_values").size() == 1);
}

TEST_CASE("unmonitored values are read over REST")
{
    Fixture f;
    f.connect();
    REQUIRE(std::get<double>(f.client->dataref("sim/x")->value()) == 1.25);
}

TEST_CASE("writes and commands go over the websocket")
{
    Fixture f;
    f.connect();
    auto x = f.client->dataref("sim/x");
    x->set_value(2.0);
    x->write();
    auto set = f.ws->sent("dataref_set_values");
    REQUIRE(set.size() == 1);
    REQUIRE(set[0]["params"]["datarefs"][0] == json{{"id", 11}, {"value", 2.0}});

    f.client->command("sim/operation/pause_toggle", 1.0)->execute();
    auto cmd = f.ws->sent("command_set_is_active");
    REQUIRE(cmd.size() == 1);
    REQUIRE(cmd[0]["params"]["commands"][0]["duration"] == 1.0);

    REQUIRE_THROWS_AS(f.client->dataref("sim/farr")->write(), NotWritable);
}

TEST_CASE("command activity is monitored by name")
{
    std::atomic<int> active{0};
    Fixture f;
    f.connect();
    f.client->events().command_active.add([&active](const std::string &path, bool on)
                                          {
        if (path == "sim/operation/pause_toggle" && on)
            ++active; });
    auto c = f.client->command("sim/operation/pause_toggle");
    f.client->monitor(*c);
    REQUIRE(f.ws->sent("command_subscribe_is_active").size() == 1);
    f.ws->push(json{{"type", "command_update_is_active"}, {"data", {{"7", true}}}});
    REQUIRE(eventually([&]
                       { return active.load() == 1; }));
    f.client->unmonitor(*c);
    REQUIRE(f.ws->sent("command_unsubscribe_is_active").size() == 1);
}

TEST_CASE("rest mode writes with PATCH and activates with POST")
{
    auto cfg = test_config();
    cfg.use_rest = true;
    Fixture f(cfg);
    f.http->route("GET", "/api/v1/datarefs?filter%5Bname%5D=sim%2Fx",
                  json{{"data", json::array({dataref_entry(11, "sim/x", "float", true)})}});
    f.http->route("PATCH", "/api/v1/datarefs/11/value", json{{"data", 0}});

    auto x = f.client->dataref("sim/x", true);
    x->set_value(5.0);
    REQUIRE(f.http->requests.back().verb == "PATCH");
    REQUIRE(json::parse(f.http->requests.back().body) == json{{"data", 5.0}});
    REQUIRE(f.ws->sent().empty());
}

TEST_CASE("offline use reports typed failures")
{
    Fixture f;
    f.http->route("GET", "/api/v1/datarefs?filter%5Bname%5D=sim%2Fx",
                  json{{"data", json::array({dataref_entry(11, "sim/x", "float", true)})}});

    auto x = f.client->dataref("sim/x");
    REQUIRE(x->valid());
    x->set_value(1.0);
    REQUIRE_THROWS_AS(x->write(), NotConnected);
    REQUIRE_THROWS_AS(f.client->dataref("sim/nowhere")->write(), UnknownPath);

    f.http->down = true;
    REQUIRE_THROWS_AS(f.client->dataref("sim/y")->value(), NotConnected);

    // monitoring offline only counts; nothing is sent
    f.client->monitor(*x);
    REQUIRE(f.ws->sent().empty());
}

TEST_CASE("subscriptions made before connecting are sent on open")
{
    Fixture f;
    auto x = f.client->dataref("sim/x");
    f.client->monitor(*x);
    f.client->connection().step();
    auto sub = f.ws->sent("dataref_subscribe_values");
    REQUIRE(sub.size() == 1);
    REQUIRE(sub[0]["params"]["datarefs"][0]["id"] == 11);
}

TEST_CASE("closed socket is picked up by the listener and the monitor")
{
    Fixture f;
    f.connect();
    f.ws->close();
    REQUIRE(eventually([&]
                       { return !f.client->listener().running(); }));
    f.client->connection().step();
    REQUIRE(f.closes.load() == 1);
    REQUIRE_FALSE(f.client->connected());
    REQUIRE_FALSE(f.client->dispatcher().attached());
}

TEST_CASE("disconnect stops everything and invalidates metadata")
{
    Fixture f;
    f.connect();
    auto epoch = f.client->cache().epoch();
    f.client->disconnect();
    REQUIRE_FALSE(f.client->listener().running());
    REQUIRE_FALSE(f.ws->is_open());
    REQUIRE_FALSE(f.client->cache().has_data());
    REQUIRE(f.client->cache().epoch() > epoch);
    REQUIRE_FALSE(f.client->subscriptions().on_wire());
    REQUIRE_FALSE(f.client->connected());
    REQUIRE(f.closes.load() == 1);
    REQUIRE(f.client->state() == ConnectionState::WsDisconnected);
}

TEST_CASE("beacon points the client at the simulator host")
{
    auto cfg = test_config();
    cfg.use_beacon = true;
    Fixture f(cfg, true);

    BeaconData b;
    b.host = "192.0.2.10";
    b.port = 49000;
    b.hostname = "rig";
    b.simulator_version = 121400;
    b.role = 1;
    f.beacon_socket->push(encode_beacon(b), b.host);

    f.client->beacon()->poll_once();
    REQUIRE(f.client->rest().host() == "192.0.2.10");
    REQUIRE(f.client->rest().port() == 8086);
    REQUIRE(f.client->state() == ConnectionState::ReceivingBeacon);

    f.client->connection().step();
    REQUIRE(f.ws->last_host == "192.0.2.10");
}
