#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/version.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/dispatch.hpp>
#include <openssl/err.h>
#include <utility>

void BeastWsTransport::connect(const Endpoint& endpoint) {
    net::post(strand_, [self = shared_from_this(), endpoint]() {
        if (self->closing_ || self->down_) return;
        self->endpoint_ = endpoint;
        if (endpoint.secure) {
            self->tls_.emplace(self->strand_, self->sslCtx_);
        } else {
            self->plain_.emplace(self->strand_);
        }
        self->resolver_.async_resolve(self->endpoint_.host, self->endpoint_.port,
            [self](beast::error_code ec, tcp::resolver::results_type results){
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::dispatch(strand_, [self = shared_from_this()]() {
        if (self->closing_ || self->down_) return;
        self->closing_ = true;
        self->pingTimer_.cancel();

        if (self->open_) {
            self->withWs([self](auto& ws) {
                ws.async_close(websocket::close_code::normal, [self](beast::error_code ec){
                    self->reportDown(ec ? ec.message() : std::string{});
                });
            });
            return;
        }

        // Still resolving/connecting/handshaking: abort whatever is pending
        self->resolver_.cancel();
        self->withWs([](auto& ws) {
            beast::error_code ignored;
            beast::get_lowest_layer(ws).socket().close(ignored);
        });
        self->reportDown({});
    });
}

void BeastWsTransport::send(std::string msg) {
    // dispatch: when called from the owning strand the payload is queued before
    // any status handler posted earlier can take the unsent tail
    net::dispatch(strand_, [self = shared_from_this(), m = std::move(msg)]() mutable {
        self->writeQueue_.emplace_back(std::move(m));
        if (self->open_ && !self->writing_) {
            self->doWrite();
        }
    });
}

std::deque<std::string> BeastWsTransport::takeUnsent() {
    return std::exchange(writeQueue_, {});
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closing_ || down_) return;
    if (ec) { reportDown("resolve: " + ec.message()); return; }
    withWs([this, results](auto& ws) {
        beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws).async_connect(results,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep){
                self->onConnect(ec, ep);
            });
    });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (closing_ || down_) return;
    if (ec) { reportDown("connect: " + ec.message()); return; }

    if (!tls_) {
        startWsHandshake();
        return;
    }

    auto& stream = tls_->next_layer();
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        reportDown("tls sni: " + ssl_ec.message());
        return;
    }
    if (!SSL_set1_host(stream.native_handle(), endpoint_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        reportDown("tls host check: " + ssl_ec.message());
        return;
    }
    stream.set_verify_mode(ssl::verify_peer);
    stream.async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec){
            if (self->closing_ || self->down_) return;
            if (ec) { self->reportDown("tls handshake: " + ec.message()); return; }
            self->startWsHandshake();
        });
}

void BeastWsTransport::startWsHandshake() {
    withWs([this](auto& ws) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("wsbridge ") + BOOST_BEAST_VERSION_STRING);
        }));
        ws.async_handshake(endpoint_.hostHeader(), endpoint_.target,
            [self = shared_from_this()](beast::error_code ec){ self->onWsHandshake(ec); });
    });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (closing_ || down_) return;
    if (ec) { reportDown("websocket handshake: " + ec.message()); return; }
    open_ = true;
    withWs([](auto& ws) { ws.text(true); });
    if (onStatus_) onStatus_(true);
    doRead();
    schedulePing();
    if (!writeQueue_.empty() && !writing_) doWrite();
}

void BeastWsTransport::doRead() {
    withWs([this](auto& ws) {
        ws.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
            self->onRead(ec, bytes);
        });
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            reportDown("closed by peer");
        } else {
            reportDown("read: " + ec.message());
        }
        return;
    }

    if (onMessage_) {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        onMessage_(std::move(payload));
    } else {
        buf_.consume(buf_.size());
    }

    if (!down_) doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty() || down_) { writing_ = false; return; }
    writing_ = true;
    const auto& front = writeQueue_.front();
    withWs([this, &front](auto& ws) {
        ws.async_write(net::buffer(front), [self = shared_from_this()](beast::error_code ec, std::size_t){
            if (ec) {
                // front stays queued: it is part of the unsent tail
                self->writing_ = false;
                self->reportDown("write: " + ec.message());
                return;
            }
            self->writeQueue_.pop_front();
            self->doWrite();
        });
    });
}

void BeastWsTransport::schedulePing() {
    pingTimer_.expires_after(std::chrono::seconds(25));
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec){
        if (ec || self->down_ || self->closing_) return;
        self->withWs([self](auto& ws) {
            ws.async_ping({}, [self](beast::error_code ec2){
                if (ec2) { self->reportDown("ping: " + ec2.message()); return; }
                self->schedulePing();
            });
        });
    });
}

void BeastWsTransport::reportDown(const std::string& error) {
    if (down_) return;
    down_ = true;
    open_ = false;
    pingTimer_.cancel();
    if (!closing_ && !error.empty() && onError_) onError_(error);
    if (onStatus_) onStatus_(false);
}
