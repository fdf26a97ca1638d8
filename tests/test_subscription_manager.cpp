/*
 * File: tests/test_subscription_manager.cpp
 * Project: XPLink
 * Purpose: Reference counting, bulk requests and array index reconciliation
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>

#include <atomic>
#include <thread>

#include "fakes.hpp"
#include "xplink/entities.hpp"
#include "xplink/errors.hpp"
#include "xplink/subscription_manager.hpp"

using namespace xplink;
using namespace xplink_test;

namespace
{

struct Fixture
{
    Fixture()
    {
        cache.reload(source);
        subs.resubscribe_all();
        sink.frames.clear();
    }

    std::vector<json> subscribes() const { return sink.of_type("dataref_subscribe_values"); }
    std::vector<json> unsubscribes() const { return sink.of_type("dataref_unsubscribe_values"); }

    FakeSource source = standard_source();
    MetadataCache cache;
    RecordingSink sink;
    SubscriptionManager subs{cache, sink, 3};
};

// Routes handle monitoring into a subscription table; everything else is offline.
class TableBackend : public EntityBackend
{
public:
    explicit TableBackend(Fixture &f) : f_(f) {}

    std::shared_ptr<const DatarefMeta> dataref_meta(const std::string &) override { throw NotConnected(); }
    std::shared_ptr<const CommandMeta> command_meta(const std::string &) override { throw NotConnected(); }
    uint64_t metadata_epoch() const override { return f_.cache.epoch(); }
    std::optional<Value> monitored_value(const DatarefKey &key) override { return f_.subs.last_value(key); }
    json fetch_value(const DatarefMeta &) override { throw NotConnected(); }
    void write_value(const DatarefMeta &, std::optional<int>, const json &) override { throw NotConnected(); }
    void execute_command(const CommandMeta &, double) override { throw NotConnected(); }
    void monitor_datarefs(const std::vector<DatarefKey> &keys, bool on) override
    {
        if (on)
            f_.subs.subscribe(keys);
        else
            f_.subs.unsubscribe(keys);
    }
    void monitor_command(const std::string &path, bool on) override
    {
        if (on)
            f_.subs.subscribe_command(path);
        else
            f_.subs.unsubscribe_command(path);
    }

private:
    Fixture &f_;
};

// Runs body(i) on n threads released together.
template <typename Body>
void run_together(int n, Body body)
{
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i)
        threads.emplace_back([&go, &body, i]
                             {
            while (!go.load())
                std::this_thread::yield();
            body(i); });
    go = true;
    for (auto &t : threads)
        t.join();
}

} // namespace

TEST_CASE("dataref names with and without element suffix")
{
    auto k = parse_dataref_name("sim/arr[3]");
    REQUIRE(k.path == "sim/arr");
    REQUIRE(k.index == 3);
    REQUIRE_FALSE(parse_dataref_name("sim/x").index);
    REQUIRE(to_string(k) == "sim/arr[3]");

    REQUIRE_THROWS_AS(parse_dataref_name(""), ContractError);
    REQUIRE_THROWS_AS(parse_dataref_name("sim/arr[]"), ContractError);
    REQUIRE_THROWS_AS(parse_dataref_name("sim/arr[x]"), ContractError);
    REQUIRE_THROWS_AS(parse_dataref_name("sim/arr[3"), ContractError);
    REQUIRE_THROWS_AS(parse_dataref_name("sim/arr[3]x"), ContractError);
    REQUIRE_THROWS_AS(parse_dataref_name("[3]"), ContractError);
}

TEST_CASE("N monitors send one subscribe and N unmonitors one unsubscribe")
{
    Fixture f;
    const int n = GENERATE(1, 2, 5);
    for (int i = 0; i < n; ++i)
        f.subs.subscribe({key("sim/x")});
    REQUIRE(f.subscribes().size() == 1);
    REQUIRE(f.subs.ref_count(key("sim/x")) == static_cast<unsigned>(n));

    for (int i = 0; i < n; ++i)
    {
        REQUIRE(f.unsubscribes().empty());
        f.subs.unsubscribe({key("sim/x")});
    }
    REQUIRE(f.unsubscribes().size() == 1);
    REQUIRE(f.unsubscribes()[0]["params"]["datarefs"] == json::array({json{{"id", 11}}}));
    REQUIRE(f.subs.ref_count(key("sim/x")) == 0);
}

TEST_CASE("handles monitored from many threads still make one subscribe and one unsubscribe")
{
    Fixture f;
    auto backend = std::make_shared<TableBackend>(f);
    const int n = 8;
    std::vector<std::shared_ptr<Dataref>> handles;
    for (int i = 0; i < n; ++i)
        handles.push_back(std::make_shared<Dataref>(backend, i % 2 ? "sim/x" : "sim/arr[3]"));

    // every thread keeps at least one count from its first monitor on
    run_together(n, [&](int i)
                 {
        auto &d = *handles[static_cast<std::size_t>(i)];
        for (int k = 0; k < 50; ++k)
        {
            d.monitor();
            d.monitor();
            d.unmonitor();
        }
        for (int k = 0; k < 49; ++k)
            d.unmonitor(); });

    REQUIRE(f.subs.ref_count(key("sim/x")) == static_cast<unsigned>(n / 2));
    REQUIRE(f.subs.ref_count(key("sim/arr[3]")) == static_cast<unsigned>(n / 2));
    REQUIRE(f.subscribes().size() == 2);
    REQUIRE(f.unsubscribes().empty());
    REQUIRE(f.subs.current_indices("sim/arr") == std::vector<int>{3});

    run_together(n, [&](int i)
                 {
        auto &d = *handles[static_cast<std::size_t>(i)];
        for (int k = 0; k < 50; ++k)
        {
            d.monitor();
            d.unmonitor();
        }
        d.unmonitor(); });

    REQUIRE(f.subs.ref_count(key("sim/x")) == 0);
    REQUIRE(f.subs.ref_count(key("sim/arr[3]")) == 0);
    REQUIRE(f.subscribes().size() == 2);
    REQUIRE(f.unsubscribes().size() == 2);
}

TEST_CASE("two handles on the same path share one wire subscription")
{
    Fixture f;
    f.subs.subscribe({key("sim/x")});
    f.subs.subscribe({key("sim/x")});
    f.subs.unsubscribe({key("sim/x")});
    REQUIRE(f.unsubscribes().empty());
    f.subs.unsubscribe({key("sim/x")});
    REQUIRE(f.unsubscribes().size() == 1);

    // one more unsubscribe is only a warning
    f.subs.unsubscribe({key("sim/x")});
    REQUIRE(f.unsubscribes().size() == 1);
}

TEST_CASE("array elements monitored together make one bulk request")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr[7]"), key("sim/arr[3]"), key("sim/x")});
    REQUIRE(f.sink.frames.size() == 1);
    auto list = f.sink.frames[0]["params"]["datarefs"];
    REQUIRE(list.size() == 2);
    REQUIRE(list[0] == json{{"id", 42}, {"index", json::array({3, 7})}});
    REQUIRE(list[1] == json{{"id", 11}});
    REQUIRE(f.subs.current_indices("sim/arr") == std::vector<int>{3, 7});

    auto updates = f.subs.reconcile(42, json::array({10, 20}));
    REQUIRE(updates);
    REQUIRE(updates->size() == 2);
    REQUIRE((*updates)[0].index == 3);
    REQUIRE(std::get<double>((*updates)[0].value) == 10.0);
    REQUIRE((*updates)[1].index == 7);
    REQUIRE(std::get<double>((*updates)[1].value) == 20.0);
    REQUIRE(std::get<double>(*f.subs.last_value(key("sim/arr[7]"))) == 20.0);
}

TEST_CASE("adding an index requests only the new one and keeps the old set in history")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr[1]"), key("sim/arr[2]")});
    f.subs.subscribe({key("sim/arr[5]"), key("sim/arr[7]")});
    REQUIRE(f.subscribes().size() == 2);
    REQUIRE(f.subscribes()[1]["params"]["datarefs"][0]["index"] == json::array({5, 7}));
    REQUIRE(f.subs.current_indices("sim/arr") == std::vector<int>{1, 2, 5, 7});
    REQUIRE(f.subs.index_history("sim/arr") == std::vector<std::vector<int>>{{1, 2}});

    // an element already on the wire is not requested again
    f.subs.subscribe({key("sim/arr[5]")});
    REQUIRE(f.subscribes().size() == 2);
}

TEST_CASE("late payload is paired with the most recent index set of its length")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr[1]"), key("sim/arr[2]")});
    f.subs.subscribe({key("sim/arr[5]"), key("sim/arr[7]")});
    f.subs.unsubscribe({key("sim/arr[2]")});

    REQUIRE(f.unsubscribes().size() == 1);
    REQUIRE(f.unsubscribes()[0]["params"]["datarefs"][0] == json{{"id", 42}, {"index", json::array({2})}});
    REQUIRE(f.subs.current_indices("sim/arr") == std::vector<int>{1, 5, 7});
    REQUIRE(f.subs.index_history("sim/arr") == std::vector<std::vector<int>>{{1, 2, 5, 7}, {1, 2}});

    SECTION("length of the current set")
    {
        auto u = *f.subs.reconcile(42, json::array({10, 50, 70}));
        REQUIRE(u.size() == 3);
        REQUIRE(u[1].index == 5);
        REQUIRE(std::get<double>(u[2].value) == 70.0);
    }
    SECTION("length 2 matches [1,2], not [1,5,7]")
    {
        auto u = *f.subs.reconcile(42, json::array({11, 22}));
        REQUIRE(u.size() == 2);
        REQUIRE(u[0].index == 1);
        REQUIRE(std::get<double>(u[0].value) == 11.0);
        REQUIRE(u[1].index == 2);
        REQUIRE(std::get<double>(u[1].value) == 22.0);
        // dropped element is delivered but not remembered
        REQUIRE(std::get<double>(*f.subs.last_value(key("sim/arr[1]"))) == 11.0);
        REQUIRE_FALSE(f.subs.last_value(key("sim/arr[2]")));
    }
    SECTION("length 4 matches the previous generation")
    {
        auto u = *f.subs.reconcile(42, json::array({1, 2, 5, 7}));
        REQUIRE(u.size() == 4);
        REQUIRE(u[3].index == 7);
    }
    SECTION("no matching length drops the payload")
    {
        auto u = f.subs.reconcile(42, json::array({1, 2, 3, 4, 5}));
        REQUIRE(u);
        REQUIRE(u->empty());
    }
}

TEST_CASE("index history is bounded")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr[0]")});
    for (int i = 1; i <= 6; ++i)
        f.subs.subscribe({key("sim/arr[" + std::to_string(i) + "]")});
    auto h = f.subs.index_history("sim/arr");
    REQUIRE(h.size() == 3);
    REQUIRE(h.front() == std::vector<int>{0, 1, 2, 3, 4, 5});
}

TEST_CASE("last element gone unsubscribes the whole identifier")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr[3]"), key("sim/arr[7]")});
    f.subs.unsubscribe({key("sim/arr[3]"), key("sim/arr[7]")});
    REQUIRE(f.unsubscribes().size() == 1);
    REQUIRE(f.unsubscribes()[0]["params"]["datarefs"][0] == json{{"id", 42}});
    REQUIRE(f.subs.current_indices("sim/arr").empty());
    REQUIRE_FALSE(f.subs.reconcile(42, json::array({1, 2})));
}

TEST_CASE("dropping the whole value keeps monitored elements on the wire")
{
    Fixture f;
    f.subs.subscribe({key("sim/arr"), key("sim/arr[3]")});
    f.subs.unsubscribe({key("sim/arr")});
    REQUIRE(f.unsubscribes().size() == 1);
    REQUIRE(f.unsubscribes()[0]["params"]["datarefs"][0] == json{{"id", 42}});
    auto subs = f.subscribes();
    REQUIRE(subs.size() == 2);
    REQUIRE(subs[1]["params"]["datarefs"][0] == json{{"id", 42}, {"index", json::array({3})}});
    REQUIRE(f.subs.ref_count(key("sim/arr[3]")) == 1);
}

TEST_CASE("whole array payload goes to whole value subscribers")
{
    Fixture f;
    f.subs.subscribe({key("sim/farr")});
    auto u = *f.subs.reconcile(43, json::array({1.5, 2.5, 3.5}));
    REQUIRE(u.size() == 1);
    REQUIRE_FALSE(u[0].index);
    REQUIRE(std::get<std::vector<double>>(u[0].value).size() == 3);
    // elements of a whole value can be read without their own subscription
    REQUIRE(std::get<double>(*f.subs.last_value(key("sim/farr[1]"))) == 2.5);
}

TEST_CASE("scalar values bypass reconciliation")
{
    Fixture f;
    f.subs.subscribe({key("sim/x"), key("sim/name")});
    auto u = *f.subs.reconcile(11, json(3.25));
    REQUIRE(u.size() == 1);
    REQUIRE(std::get<double>(u[0].value) == 3.25);
    REQUIRE(std::get<double>(*f.subs.last_value(key("sim/x"))) == 3.25);

    auto b = *f.subs.reconcile(50, json(base64_encode("N172SG")));
    REQUIRE(std::get<std::string>(b[0].value) == "N172SG");

    REQUIRE(f.subs.reconcile(11, json::array({1}))->empty());
}

TEST_CASE("element of a scalar dataref is refused")
{
    Fixture f;
    f.subs.subscribe({key("sim/x[2]")});
    REQUIRE(f.sink.frames.empty());
    REQUIRE(f.subs.ref_count(key("sim/x[2]")) == 0);
}

TEST_CASE("subscriptions made offline are replayed once wired")
{
    FakeSource source = standard_source();
    MetadataCache cache;
    RecordingSink sink;
    SubscriptionManager subs(cache, sink);

    subs.subscribe({key("sim/x"), key("sim/arr[3]"), key("sim/arr[7]")});
    subs.subscribe_command("sim/operation/pause_toggle");
    REQUIRE(sink.frames.empty());
    REQUIRE_FALSE(subs.on_wire());

    cache.reload(source);
    subs.rebuild();
    subs.resubscribe_all();
    REQUIRE(subs.on_wire());
    auto d = sink.of_type("dataref_subscribe_values");
    REQUIRE(d.size() == 1);
    REQUIRE(d[0]["params"]["datarefs"].size() == 2);
    auto c = sink.of_type("command_subscribe_is_active");
    REQUIRE(c.size() == 1);
    REQUIRE(c[0]["params"]["commands"][0]["id"] == 7);
}

TEST_CASE("reconnect resolves identifiers again")
{
    Fixture f;
    f.subs.subscribe({key("sim/x")});
    f.subs.clear_wire_state();
    REQUIRE_FALSE(f.subs.on_wire());
    REQUIRE_FALSE(f.subs.reconcile(11, json(1.0)));

    // aircraft change: same name, new identifier
    f.source.datarefs[0]["id"] = 111;
    f.cache.reload(f.source, true);
    f.subs.rebuild();
    f.subs.resubscribe_all();
    REQUIRE(f.subscribes().back()["params"]["datarefs"][0]["id"] == 111);
    REQUIRE(f.subs.reconcile(111, json(2.0))->size() == 1);
    REQUIRE_FALSE(f.subs.reconcile(11, json(2.0)));
    REQUIRE(f.subs.ref_count(key("sim/x")) == 1);
}

TEST_CASE("commands are reference counted")
{
    Fixture f;
    f.subs.subscribe_command("sim/operation/pause_toggle");
    f.subs.subscribe_command("sim/operation/pause_toggle");
    REQUIRE(f.sink.of_type("command_subscribe_is_active").size() == 1);
    REQUIRE(f.subs.command_ref_count("sim/operation/pause_toggle") == 2);

    f.subs.unsubscribe_command("sim/operation/pause_toggle");
    REQUIRE(f.sink.of_type("command_unsubscribe_is_active").empty());
    f.subs.unsubscribe_command("sim/operation/pause_toggle");
    auto u = f.sink.of_type("command_unsubscribe_is_active");
    REQUIRE(u.size() == 1);
    REQUIRE(u[0]["params"]["commands"][0]["id"] == 7);
}

TEST_CASE("index history ring")
{
    IndexHistory h(2);
    h.push({1});
    h.push({1, 2});
    h.push({1, 2, 3});
    REQUIRE(h.size() == 2);
    REQUIRE(h.find_size(1) == nullptr);
    REQUIRE(*h.find_size(2) == std::vector<int>{1, 2});
    h.clear();
    REQUIRE(h.size() == 0);
}
