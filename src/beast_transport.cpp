/*
 * File: src/beast_transport.cpp
 * Project: XPLink
 * Purpose: Boost.Beast / Boost.Asio implementations of the transport seams
 * Last updated: 2026-10-19
 */

#include "xplink/beast_transport.hpp"
#include "xplink/errors.hpp"
#include "xplink/logger.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace xplink
{

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using udp = boost::asio::ip::udp;

// ---------------------------------------------------------------- HTTP

BeastHttpClient::BeastHttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse BeastHttpClient::request(const HttpRequest &req)
{
    http::verb verb = http::string_to_verb(req.verb);
    if (verb == http::verb::unknown)
        throw ContractError("unsupported HTTP verb " + req.verb);

    net::io_context ioc;
    tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};

    http::request<http::string_body> r{verb, req.target, 11};
    r.set(http::field::host, req.host);
    r.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    r.set(http::field::accept, "application/json");
    if (!req.body.empty())
    {
        r.set(http::field::content_type, "application/json");
        r.body() = req.body;
    }
    r.prepare_payload();

    beast::flat_buffer buf;
    http::response<http::string_body> res;
    beast::error_code result;
    const char *stage = "resolve";

    resolver.async_resolve(req.host, std::to_string(req.port),
                           [&](beast::error_code ec, tcp::resolver::results_type results)
                           {
        if (ec) { result = ec; return; }
        stage = "connect";
        stream.expires_after(timeout_);
        stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint &)
                             {
            if (ec) { result = ec; return; }
            stage = "write";
            http::async_write(stream, r, [&](beast::error_code ec, std::size_t)
                              {
                if (ec) { result = ec; return; }
                stage = "read";
                http::async_read(stream, buf, res, [&](beast::error_code ec, std::size_t)
                                 { result = ec; });
            });
        });
    });
    ioc.run();

    if (result)
        throw TransportError(std::string("http ") + stage + " " + req.host + ":" + std::to_string(req.port) +
                             req.target + ": " + result.message());

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())};
}

// ---------------------------------------------------------------- WebSocket

BeastWsChannel::BeastWsChannel(std::chrono::milliseconds handshake_timeout)
    : handshake_timeout_(handshake_timeout)
{
}

BeastWsChannel::~BeastWsChannel()
{
    close();
}

void BeastWsChannel::open(const std::string &host, uint16_t port, const std::string &target)
{
    close();

    ioc_ = std::make_unique<net::io_context>();
    ws_ = std::make_unique<Stream>(*ioc_);
    try
    {
        tcp::resolver resolver{*ioc_};
        auto results = resolver.resolve(host, std::to_string(port));
        beast::get_lowest_layer(*ws_).connect(results);

        websocket::stream_base::timeout opt{handshake_timeout_, websocket::stream_base::none(), false};
        ws_->set_option(opt);
        ws_->set_option(websocket::stream_base::decorator([](websocket::request_type &r)
                                                          { r.set(http::field::user_agent, "xplink"); }));
        ws_->text(true);
        ws_->handshake(host + ":" + std::to_string(port), target);
    }
    catch (const beast::system_error &e)
    {
        ws_.reset();
        ioc_.reset();
        throw TransportError("websocket ws://" + host + ":" + std::to_string(port) + target + ": " +
                             e.code().message());
    }

    {
        std::scoped_lock lk(m_);
        inbox_.clear();
        closed_ = false;
    }
    outbox_.clear();
    buffer_.clear();
    open_ = true;
    work_.emplace(net::make_work_guard(*ioc_));
    do_read();
    io_thread_ = std::thread([this]
                             { ioc_->run(); });
    XPLINK_LOG_DEBUG("websocket open ws://{}:{}{}", host, port, target);
}

void BeastWsChannel::close()
{
    if (!io_thread_.joinable())
        return;

    net::post(*ioc_, [this]
              {
        if (ws_->is_open() && outbox_.empty())
        {
            ws_->async_close(websocket::close_code::normal, [this](beast::error_code ec)
                             {
                if (ec)
                    beast::get_lowest_layer(*ws_).close();
                work_.reset(); });
        }
        else
        {
            // a write is still in flight; close_frame would overlap it
            beast::get_lowest_layer(*ws_).close();
            work_.reset();
        } });
    io_thread_.join();

    open_ = false;
    {
        std::scoped_lock lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
    ws_.reset();
    ioc_.reset();
}

void BeastWsChannel::send(const std::string &text)
{
    if (!open_)
        throw TransportError("websocket not open");
    net::post(*ioc_, [this, text]
              {
        outbox_.push_back(text);
        if (outbox_.size() == 1)
            do_write(); });
}

WsChannel::ReadStatus BeastWsChannel::receive(std::string &out, std::chrono::milliseconds timeout)
{
    std::unique_lock lk(m_);
    cv_.wait_for(lk, timeout, [this]
                 { return !inbox_.empty() || closed_; });
    if (!inbox_.empty())
    {
        out = std::move(inbox_.front());
        inbox_.pop_front();
        return ReadStatus::Message;
    }
    return closed_ ? ReadStatus::Closed : ReadStatus::Timeout;
}

void BeastWsChannel::do_read()
{
    ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t)
                    {
        if (ec)
        {
            on_closed(ec);
            return;
        }
        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        {
            std::scoped_lock lk(m_);
            inbox_.push_back(std::move(text));
        }
        cv_.notify_one();
        do_read(); });
}

void BeastWsChannel::do_write()
{
    ws_->async_write(net::buffer(outbox_.front()), [this](beast::error_code ec, std::size_t)
                     {
        if (ec)
        {
            XPLINK_LOG_WARN("websocket write failed: {}", ec.message());
            outbox_.clear();
            beast::get_lowest_layer(*ws_).close(); // read side reports the close
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty())
            do_write(); });
}

void BeastWsChannel::on_closed(beast::error_code ec)
{
    if (ec != websocket::error::closed && ec != net::error::operation_aborted)
        XPLINK_LOG_DEBUG("websocket read ended: {}", ec.message());
    open_ = false;
    {
        std::scoped_lock lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
    work_.reset();
}

// ---------------------------------------------------------------- Beacon

void UdpBeaconSocket::open(const std::string &group, uint16_t port)
{
    close();
    try
    {
        auto sock = std::make_unique<udp::socket>(ioc_);
        udp::endpoint listen{net::ip::address_v4::any(), port};
        sock->open(listen.protocol());
        sock->set_option(net::socket_base::reuse_address(true));
        sock->bind(listen);
        sock->set_option(net::ip::multicast::join_group(net::ip::make_address(group)));
        socket_ = std::move(sock);
    }
    catch (const boost::system::system_error &e)
    {
        throw TransportError("beacon socket " + group + ":" + std::to_string(port) + ": " + e.code().message());
    }
}

void UdpBeaconSocket::close()
{
    if (!socket_)
        return;
    boost::system::error_code ec;
    socket_->close(ec);
    socket_.reset();
}

std::optional<Datagram> UdpBeaconSocket::receive(std::chrono::milliseconds timeout)
{
    if (!socket_)
        throw TransportError("beacon socket not open");

    std::optional<Datagram> out;
    boost::system::error_code failure;
    udp::endpoint sender;

    ioc_.restart();
    socket_->async_receive_from(net::buffer(buf_), sender,
                                [&](boost::system::error_code ec, std::size_t n)
                                {
        if (!ec)
            out = Datagram{std::vector<uint8_t>(buf_.begin(), buf_.begin() + n), sender.address().to_string()};
        else if (ec != net::error::operation_aborted)
            failure = ec; });
    ioc_.run_for(timeout);
    if (!ioc_.stopped())
    {
        // timed out: cancel and let the aborted handler run before the locals go away
        boost::system::error_code ec;
        socket_->cancel(ec);
        ioc_.restart();
        ioc_.run();
    }

    if (failure)
        throw TransportError("beacon receive: " + failure.message());
    return out;
}

} // namespace xplink
