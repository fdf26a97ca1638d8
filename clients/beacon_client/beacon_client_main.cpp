/*
 * File: clients/beacon_client/beacon_client_main.cpp
 * Project: XPLink
 * Purpose: Example discovery client, prints simulator beacons
 * Notes:
 *  - listens on the multicast group from the config (default 239.255.1.1:49707)
 *  - prints every transition in and out of beacon detection
 * Last updated: 2026-10-19
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "xplink/beacon_monitor.hpp"
#include "xplink/beast_transport.hpp"
#include "xplink/config.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"

namespace
{
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }
} // namespace

int main(int argc, char **argv)
{
    xplink::ClientConfig cfg;
    int seconds = 60;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            cfg = xplink::load_config(argv[++i]);
        else if (a == "--group" && i + 1 < argc)
            cfg.beacon.group = argv[++i];
        else if (a == "--port" && i + 1 < argc)
            cfg.beacon.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        else if (a == "--seconds" && i + 1 < argc)
            seconds = std::stoi(argv[++i]);
        else
        {
            std::cerr << "usage: beacon_client [--config file] [--group addr] [--port n] [--seconds n]\n";
            return 2;
        }
    }

    xplink::Logger::initialize();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    xplink::UdpBeaconSocket socket;
    xplink::BeaconMonitor monitor(cfg.beacon, socket);
    monitor.set_callback([](bool connected, const std::optional<xplink::BeaconData> &data, bool same_host)
                         {
        if (connected && data)
            std::cout << "[beacon_client] found " << xplink::to_string(*data)
                      << (same_host ? " (this host)" : "") << std::endl;
        else
            std::cout << "[beacon_client] lost" << std::endl; });

    try
    {
        monitor.start();
    }
    catch (const xplink::TransportError &e)
    {
        std::cerr << "[beacon_client] " << e.what() << std::endl;
        return 1;
    }

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_stop && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    monitor.stop();
    std::cout << "[beacon_client] " << monitor.failures() << " failed receives at exit" << std::endl;
    xplink::Logger::shutdown();
    return 0;
}
