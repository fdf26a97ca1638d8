/*
 * File: clients/monitor_client/monitor_client_main.cpp
 * Project: XPLink
 * Purpose: Example WebSocket consumer, prints dataref and command updates
 * Notes:
 *  - datarefs take an optional element suffix: --dataref sim/cockpit2/engine/actuators/throttle_ratio[0]
 *  - all datarefs are requested in one bulk frame
 * Last updated: 2026-10-19
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

#include "xplink/client.hpp"
#include "xplink/errors.hpp"

namespace
{
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }

void usage()
{
    std::cerr << "usage: monitor_client [--config file] [--host h] [--port n] [--beacon] [--use-rest]\n"
                 "                      [--dataref path]... [--command path]... [--seconds n] [--dump prefix]\n";
}
} // namespace

int main(int argc, char **argv)
{
    xplink::ClientConfig cfg;
    std::vector<std::string> datarefs;
    std::vector<std::string> commands;
    std::string dump;
    int seconds = 60;
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc)
                cfg = xplink::load_config(argv[++i]);
            else if (a == "--host" && i + 1 < argc)
                cfg.host = argv[++i];
            else if (a == "--port" && i + 1 < argc)
                cfg.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            else if (a == "--beacon")
                cfg.use_beacon = true;
            else if (a == "--use-rest")
                cfg.use_rest = true;
            else if (a == "--dataref" && i + 1 < argc)
                datarefs.push_back(argv[++i]);
            else if (a == "--command" && i + 1 < argc)
                commands.push_back(argv[++i]);
            else if (a == "--seconds" && i + 1 < argc)
                seconds = std::stoi(argv[++i]);
            else if (a == "--dump" && i + 1 < argc)
                dump = argv[++i];
            else
            {
                usage();
                return 2;
            }
        }
        xplink::apply_env(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[monitor_client] " << e.what() << std::endl;
        return 2;
    }
    if (datarefs.empty())
        datarefs.push_back("sim/time/total_running_time_sec");

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    xplink::Client client(cfg);
    auto &events = client.events();
    events.state.add([](xplink::ConnectionState from, xplink::ConnectionState to)
                     { std::cout << "[monitor_client] " << xplink::to_string(from) << " -> " << xplink::to_string(to)
                                 << std::endl; });
    events.dataref_update.add([](const xplink::DatarefUpdate &u)
                              { std::cout << "[monitor_client] " << xplink::to_string(xplink::DatarefKey{u.path, u.index})
                                          << " = " << xplink::to_string(u.value) << std::endl; });
    events.command_active.add([](const std::string &path, bool active)
                              { std::cout << "[monitor_client] " << path << (active ? " active" : " inactive") << std::endl; });
    events.feedback.add([](const xplink::RequestFeedback &f)
                        {
        if (!f.success)
            std::cout << "[monitor_client] request " << f.req_id << " failed: " << f.error_code << " "
                      << f.error_message << std::endl; });

    std::vector<std::shared_ptr<xplink::Dataref>> refs;
    std::vector<std::shared_ptr<xplink::Command>> cmds;
    try
    {
        for (const auto &d : datarefs)
            refs.push_back(client.dataref(d));
        for (const auto &c : commands)
            cmds.push_back(client.command(c));

        // registered before connecting: replayed once the websocket is up
        client.monitor(refs);
        for (auto &c : cmds)
            client.monitor(*c);

        client.connect();
    }
    catch (const xplink::Error &e)
    {
        std::cerr << "[monitor_client] " << e.what() << std::endl;
        return 1;
    }

    if (!client.wait_connection(std::chrono::seconds(seconds)))
        std::cerr << "[monitor_client] no connection yet, still trying" << std::endl;
    else if (!dump.empty())
        client.cache().save(dump);

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_stop && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    client.unmonitor(refs);
    for (auto &c : cmds)
        client.unmonitor(*c);
    client.disconnect();
    return 0;
}
