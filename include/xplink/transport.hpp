/*
 * File: include/xplink/transport.hpp
 * Project: XPLink
 * Purpose: Transport seams: HTTP requests, WebSocket channel, beacon socket
 * Notes:
 *  - Beast/Asio implementations live in beast_transport.hpp
 *  - tests substitute in-memory fakes
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xplink
{

struct HttpRequest
{
    std::string host;
    uint16_t port{0};
    std::string verb{"GET"}; // GET | POST | PATCH
    std::string target;
    std::string body; // JSON, empty for GET
};

struct HttpResponse
{
    int status{0};
    std::string body;
};

class HttpClient
{
public:
    virtual ~HttpClient() = default;
    /// @throws TransportError when the server cannot be reached or the exchange fails
    virtual HttpResponse request(const HttpRequest &req) = 0;
};

class WsChannel
{
public:
    enum class ReadStatus
    {
        Message,
        Timeout,
        Closed
    };

    virtual ~WsChannel() = default;

    /// @throws TransportError if the connection or the upgrade fails
    virtual void open(const std::string &host, uint16_t port, const std::string &target) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /// @throws TransportError if the channel is closed
    virtual void send(const std::string &text) = 0;

    // Waits at most `timeout` for one text message.
    virtual ReadStatus receive(std::string &out, std::chrono::milliseconds timeout) = 0;
};

struct Datagram
{
    std::vector<uint8_t> payload;
    std::string sender;
};

class BeaconSocket
{
public:
    virtual ~BeaconSocket() = default;

    /// @throws TransportError if the multicast group cannot be joined
    virtual void open(const std::string &group, uint16_t port) = 0;
    virtual void close() = 0;

    // nullopt on timeout
    virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace xplink
