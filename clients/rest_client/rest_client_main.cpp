/*
 * File: clients/rest_client/rest_client_main.cpp
 * Project: XPLink
 * Purpose: Example REST client: capabilities, dataref read/write, command activation
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "xplink/beast_transport.hpp"
#include "xplink/config.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"
#include "xplink/rest_api.hpp"

using json = nlohmann::json;

int main(int argc, char **argv)
{
    xplink::ClientConfig cfg;
    bool pretty = false;
    std::string dataref = xplink::kUptimeDataref;
    std::optional<std::string> set_value;
    std::optional<std::string> command;
    double duration = 0.0;
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
            else if (a == "--api" && i + 1 < argc)
                cfg.api_version = argv[++i];
            else if (a == "--dataref" && i + 1 < argc)
                dataref = argv[++i];
            else if (a == "--set" && i + 1 < argc)
                set_value = argv[++i];
            else if (a == "--command" && i + 1 < argc)
                command = argv[++i];
            else if (a == "--duration" && i + 1 < argc)
                duration = std::stod(argv[++i]);
            else if (a == "--pretty")
                pretty = true;
            else
            {
                std::cerr << "usage: rest_client [--config file] [--host h] [--port n] [--api vN] [--dataref path]\n"
                             "                   [--set json] [--command path [--duration s]] [--pretty]\n";
                return 2;
            }
        }
        xplink::apply_env(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[rest_client] " << e.what() << std::endl;
        return 2;
    }

    xplink::Logger::initialize();
    xplink::BeastHttpClient http(cfg.http_timeout);
    xplink::RestApi rest(http, cfg);

    if (!rest.reachable())
    {
        std::cerr << "[rest_client] no simulator at " << cfg.host << ":" << cfg.port << std::endl;
        return 1;
    }

    try
    {
        auto caps = rest.capabilities();
        std::cout << "[rest_client] capabilities: " << (pretty ? caps.dump(2) : caps.dump()) << std::endl;
        std::cout << "[rest_client] api " << rest.set_api_version(cfg.api_version) << std::endl;
        if (auto up = rest.uptime())
            std::cout << "[rest_client] simulator uptime " << *up << " s" << std::endl;

        auto meta = rest.dataref_meta_by_name(dataref);
        if (!meta)
        {
            std::cerr << "[rest_client] unknown dataref " << dataref << std::endl;
            return 1;
        }
        std::cout << "[rest_client] " << meta->name << " id=" << meta->id << " type=" << meta->value_type
                  << (meta->is_writable ? " writable" : "") << std::endl;

        if (set_value)
        {
            if (!meta->is_writable)
                throw xplink::NotWritable(meta->name);
            json v = json::parse(*set_value, nullptr, false);
            if (v.is_discarded())
                v = *set_value;
            rest.write_dataref_value(meta->id, v, std::nullopt);
        }
        json v = rest.dataref_value(meta->id);
        std::cout << "[rest_client] value: " << (pretty ? v.dump(2) : v.dump()) << std::endl;

        if (command)
        {
            if (!rest.supports_commands())
            {
                std::cerr << "[rest_client] api " << rest.api_version() << " has no commands" << std::endl;
                return 1;
            }
            auto cmd = rest.command_meta_by_name(*command);
            if (!cmd)
            {
                std::cerr << "[rest_client] unknown command " << *command << std::endl;
                return 1;
            }
            rest.activate_command(cmd->id, duration);
            std::cout << "[rest_client] " << cmd->name << " activated for " << duration << " s" << std::endl;
        }
    }
    catch (const xplink::Error &e)
    {
        std::cerr << "[rest_client] " << e.what() << std::endl;
        return 1;
    }

    xplink::Logger::shutdown();
    return 0;
}
