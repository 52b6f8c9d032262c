#include "tidewire/core/transport/beast/websocket.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <openssl/ssl.h>

#include "tidewire/core/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::transport::beast {

namespace asio = boost::asio;
namespace bws  = boost::beast::websocket;
using boost::beast::error_code;

WebSocket::WebSocket(telemetry::WebSocket& telemetry)
    : telemetry_(telemetry)
    , ssl_ctx_(asio::ssl::context::tlsv12_client)
    , resolver_(ioc_)
    , connect_timer_(ioc_)
{
    error_code ec;
    ssl_ctx_.set_default_verify_paths(ec);
    if (ec) {
        TW_WARN("[WS] Unable to load default CA paths: " << ec.message());
    }
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer, ec);
}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path,
                         std::chrono::milliseconds timeout) noexcept {
    if (ws_) {
        TW_ERROR("[WS] connect() called twice on the same transport");
        return Error::InvalidState;
    }
    TW_TL1( telemetry_.connects_total.inc() );

    host_ = host;
    path_ = path;
    timeout_ = timeout;
    ws_ = std::make_unique<stream_type>(ioc_, ssl_ctx_);

    // SNI and certificate host check
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host.c_str())) {
        TW_ERROR("[WS] Unable to set SNI host name");
        TW_TL1( telemetry_.connect_failures_total.inc() );
        return Error::HandshakeFailed;
    }
    error_code ec;
    ws_->next_layer().set_verify_callback(asio::ssl::host_name_verification(host), ec);
    if (ec) {
        TW_ERROR("[WS] Unable to set certificate verification (" << ec.message() << ")");
        TW_TL1( telemetry_.connect_failures_total.inc() );
        return Error::HandshakeFailed;
    }

    // Nothing below waits on the network: the sequence runs on the io thread
    connecting_ = true;
    work_ = std::make_unique<work_guard_type>(asio::make_work_guard(ioc_));
    connect_timer_.expires_after(timeout);
    connect_timer_.async_wait([this](const error_code& wait_ec) {
        on_connect_deadline_(wait_ec);
    });
    resolver_.async_resolve(host, port, [this](const error_code& resolve_ec, const asio::ip::tcp::resolver::results_type& results) {
        on_resolve_(resolve_ec, results);
    });
    io_thread_ = std::thread([this]() {
        error_code run_ec;
        ioc_.run(run_ec);
        if (run_ec) {
            TW_ERROR("[WS] io_context stopped with error: " << run_ec.message());
        }
    });
    TW_DEBUG("[WS] Connecting to wss://" << host << ":" << port << path << " (timeout " << timeout.count() << " ms)");
    return Error::None;
}

bool WebSocket::send(std::string_view msg) noexcept {
    if (!open_.load(std::memory_order_acquire)) {
        TW_WARN("[WS] send() called on a closed WebSocket");
        return false;
    }
    TW_TRACE("[WS] Sending message (size " << msg.size() << ")");
    asio::post(ioc_, [this, m = std::string(msg)]() mutable {
        if (closing_ || !open_.load(std::memory_order_acquire)) {
            return;
        }
        tx_queue_.push_back(std::move(m));
        if (tx_queue_.size() == 1) {
            start_write_();
        }
    });
    return true;
}

void WebSocket::close() noexcept {
    if (io_thread_.joinable()) {
        asio::post(ioc_, [this]() { do_close_(); });
        io_thread_.join();
    }
    open_.store(false, std::memory_order_release);
    signal_close_();
}

bool WebSocket::poll_message(std::string& out) noexcept {
    return messages_.pop(out);
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    return events_.pop(out);
}

// ------------------------------------------------------------------
// io thread
// ------------------------------------------------------------------

void WebSocket::on_resolve_(const error_code& ec, const asio::ip::tcp::resolver::results_type& results) noexcept {
    if (!connecting_) {
        return;
    }
    if (ec) {
        connect_failed_(Error::ConnectionFailed, "Resolve failed for " + host_ + " (" + ec.message() + ")");
        return;
    }
    boost::beast::get_lowest_layer(*ws_).expires_after(timeout_);
    boost::beast::get_lowest_layer(*ws_).async_connect(results, [this](const error_code& connect_ec, const asio::ip::tcp::endpoint&) {
        on_tcp_connect_(connect_ec);
    });
}

void WebSocket::on_tcp_connect_(const error_code& ec) noexcept {
    if (!connecting_) {
        return;
    }
    if (ec) {
        const Error err = map_error_(ec) == Error::Timeout ? Error::Timeout : Error::ConnectionFailed;
        connect_failed_(err, "TCP connect failed (" + ec.message() + ")");
        return;
    }
    ws_->next_layer().async_handshake(asio::ssl::stream_base::client, [this](const error_code& tls_ec) {
        on_tls_handshake_(tls_ec);
    });
}

void WebSocket::on_tls_handshake_(const error_code& ec) noexcept {
    if (!connecting_) {
        return;
    }
    if (ec) {
        connect_failed_(Error::HandshakeFailed, "TLS handshake failed (" + ec.message() + ")");
        return;
    }
    // The websocket stream runs its own timeouts from here on; the connect
    // deadline still bounds the upgrade
    boost::beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(bws::stream_base::timeout::suggested(boost::beast::role_type::client));
    ws_->set_option(bws::stream_base::decorator([](bws::request_type& req) {
        req.set(boost::beast::http::field::user_agent, "tidewire");
    }));
    ws_->text(true);
    ws_->async_handshake(host_, path_, [this](const error_code& ws_ec) {
        on_ws_handshake_(ws_ec);
    });
}

void WebSocket::on_ws_handshake_(const error_code& ec) noexcept {
    if (!connecting_) {
        return;
    }
    if (ec) {
        connect_failed_(Error::HandshakeFailed, "WebSocket handshake failed (" + ec.message() + ")");
        return;
    }
    connecting_ = false;
    connect_timer_.cancel();
    open_.store(true, std::memory_order_release);
    TW_DEBUG("[WS] Connected to wss://" << host_ << path_);
    if (!events_.push(websocket::Event::make_open())) {
        TW_ERROR("[WS] Event ring full, dropping open event");
    }
    start_read_();
}

void WebSocket::on_connect_deadline_(const error_code& ec) noexcept {
    if (ec == asio::error::operation_aborted || !connecting_) {
        return;
    }
    connect_failed_(Error::Timeout, "Connect not completed within " + std::to_string(timeout_.count()) + " ms");
}

// Aborts the pending step; its handler completes with operation_aborted and
// sees connecting_ cleared
void WebSocket::connect_failed_(Error err, std::string_view what) noexcept {
    if (!connecting_) {
        return;
    }
    connecting_ = false;
    TW_ERROR("[WS] " << what);
    TW_TL1( telemetry_.connect_failures_total.inc() );
    connect_timer_.cancel();
    resolver_.cancel();
    boost::beast::get_lowest_layer(*ws_).close();
    fail_(err);
    signal_close_();
    work_.reset();
}

void WebSocket::start_read_() noexcept {
    ws_->async_read(rx_buffer_, [this](const error_code& ec, std::size_t bytes) {
        on_read_(ec, bytes);
    });
}

void WebSocket::on_read_(const error_code& ec, std::size_t bytes) noexcept {
    if (ec) {
        if (closing_) {
            TW_TRACE("[WS] Receive stopped (local shutdown)");
        }
        else {
            fail_(map_error_(ec));
        }
        open_.store(false, std::memory_order_release);
        signal_close_();
        work_.reset();
        return;
    }

    TW_TL1( telemetry_.bytes_rx_total.inc(bytes) );
    std::string msg = boost::beast::buffers_to_string(rx_buffer_.data());
    rx_buffer_.consume(rx_buffer_.size());

    if (!messages_.push(std::move(msg))) [[unlikely]] {
        // The driver is not draining fast enough. Dropping a message would
        // silently corrupt order book state, so the connection is failed.
        TW_ERROR("[WS] Inbound message ring full (" << messages_.capacity() << "), failing connection");
        TW_TL1( telemetry_.messages_dropped_total.inc() );
        fail_(Error::Backpressure);
        do_close_();
        return;
    }
    TW_TL1( telemetry_.messages_rx_total.inc() );
    start_read_();
}

void WebSocket::start_write_() noexcept {
    ws_->async_write(asio::buffer(tx_queue_.front()), [this](const error_code& ec, std::size_t bytes) {
        if (ec) {
            if (!closing_) {
                TW_ERROR("[WS] Write failed (" << ec.message() << ")");
                fail_(map_error_(ec));
                do_close_();
            }
            return;
        }
        TW_TL1( telemetry_.bytes_tx_total.inc(bytes) );
        TW_TL1( telemetry_.messages_tx_total.inc() );
        tx_queue_.pop_front();
        if (!tx_queue_.empty()) {
            start_write_();
        }
    });
}

void WebSocket::do_close_() noexcept {
    if (closing_) {
        return;
    }
    closing_ = true;
    if (connecting_) {
        TW_TRACE("[WS] Connect aborted (local shutdown)");
        connecting_ = false;
        connect_timer_.cancel();
        resolver_.cancel();
        boost::beast::get_lowest_layer(*ws_).close();
    }
    else if (ws_ && ws_->is_open()) {
        TW_TRACE("[WS] Closing WebSocket ...");
        boost::beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(1));
        ws_->async_close(bws::close_code::normal, [this](const error_code&) {
            error_code ignored;
            boost::beast::get_lowest_layer(*ws_).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            boost::beast::get_lowest_layer(*ws_).close();
        });
    }
    work_.reset();
}

void WebSocket::fail_(Error err) noexcept {
    TW_WARN("[WS] Transport failure: " << to_string(err));
    if (!events_.push(websocket::Event::make_error(err))) {
        TW_ERROR("[WS] Event ring full, dropping error event");
    }
}

void WebSocket::signal_close_() noexcept {
    if (close_signaled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    TW_TL1( telemetry_.close_events_total.inc() );
    if (!events_.push(websocket::Event::make_close())) {
        TW_ERROR("[WS] Event ring full, dropping close event");
    }
}

Error WebSocket::map_error_(const error_code& ec) noexcept {
    if (ec == bws::error::closed || ec == asio::error::eof || ec == asio::error::connection_reset) {
        return Error::RemoteClosed;
    }
    if (ec == asio::error::operation_aborted) {
        return Error::LocalShutdown;
    }
    if (ec == boost::beast::error::timeout || ec == asio::error::timed_out) {
        return Error::Timeout;
    }
    if (ec == asio::error::connection_refused || ec == asio::error::host_not_found ||
        ec == asio::error::network_unreachable || ec == asio::error::host_unreachable) {
        return Error::ConnectionFailed;
    }
    if (ec.category() == asio::error::get_ssl_category()) {
        return Error::ProtocolError;
    }
    return Error::TransportFailure;
}

} // namespace tidewire::core::transport::beast
