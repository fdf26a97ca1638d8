/*
 * File: include/xplink/beast_transport.hpp
 * Project: XPLink
 * Purpose: Boost.Beast / Boost.Asio implementations of the transport seams
 * Notes:
 *  - HTTP: one connection per request, bounded by the configured timeout
 *  - WebSocket: own io_context thread; send() and receive() are safe from any thread
 *  - Beacon: multicast join, bounded receive via run_for()
 * Last updated: 2026-10-19
 */

#pragma once
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "xplink/transport.hpp"

namespace xplink
{

class BeastHttpClient : public HttpClient
{
public:
    explicit BeastHttpClient(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    HttpResponse request(const HttpRequest &req) override;

private:
    std::chrono::milliseconds timeout_;
};

class BeastWsChannel : public WsChannel
{
public:
    explicit BeastWsChannel(std::chrono::milliseconds handshake_timeout = std::chrono::milliseconds(5000));
    ~BeastWsChannel() override;

    BeastWsChannel(const BeastWsChannel &) = delete;
    BeastWsChannel &operator=(const BeastWsChannel &) = delete;

    void open(const std::string &host, uint16_t port, const std::string &target) override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    void send(const std::string &text) override;
    ReadStatus receive(std::string &out, std::chrono::milliseconds timeout) override;

private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    // io thread only
    void do_read();
    void do_write();
    void on_closed(boost::beast::error_code ec);

    std::chrono::milliseconds handshake_timeout_;
    std::unique_ptr<boost::asio::io_context> ioc_; // fresh per connection
    std::optional<WorkGuard> work_;
    std::unique_ptr<Stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    std::thread io_thread_;

    std::mutex m_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    bool closed_{true};
    std::atomic<bool> open_{false};
};

class UdpBeaconSocket : public BeaconSocket
{
public:
    UdpBeaconSocket() = default;
    ~UdpBeaconSocket() override { close(); }

    void open(const std::string &group, uint16_t port) override;
    void close() override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;

private:
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::udp::socket> socket_;
    std::array<uint8_t, 1472> buf_{};
};

} // namespace xplink
