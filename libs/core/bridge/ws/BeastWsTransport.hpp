#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// Boost.Beast client for ws:// (plain TCP) and wss:// (TLS with peer verification and SNI).
// All I/O and every callback run on the strand passed in, which is the owning
// destination's strand.
class BeastWsTransport : public WsTransport, public std::enable_shared_from_this<BeastWsTransport> {
public:
    using Strand = net::strand<net::io_context::executor_type>;

    BeastWsTransport(Strand strand, ssl::context& sslCtx)
        : strand_(std::move(strand))
        , sslCtx_(sslCtx)
        , resolver_(strand_)
        , pingTimer_(strand_)
    {}

    void connect(const Endpoint& endpoint) override;
    void close() override;
    void send(std::string msg) override;
    std::deque<std::string> takeUnsent() override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onStatus(StatusCb cb) override { onStatus_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

private:
    using PlainWs = websocket::stream<beast::tcp_stream>;
    using TlsWs   = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    // Callbacks
    MessageCb onMessage_;
    StatusCb  onStatus_;
    ErrorCb   onError_;

    // Beast state
    Strand strand_;
    ssl::context& sslCtx_;
    tcp::resolver resolver_;
    std::optional<PlainWs> plain_;
    std::optional<TlsWs> tls_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;
    bool writing_ = false;

    // State
    Endpoint endpoint_;
    bool open_ = false;
    bool down_ = false;
    bool closing_ = false;

    template <class F>
    void withWs(F&& f) {
        if (tls_) f(*tls_);
        else if (plain_) f(*plain_);
    }

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void startWsHandshake();
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void reportDown(const std::string& error);
};
