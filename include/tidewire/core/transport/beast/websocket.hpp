#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <thread>
#include <atomic>
#include <deque>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "tidewire/core/config/limits.hpp"
#include "tidewire/core/transport/error.hpp"
#include "tidewire/core/transport/websocket/events.hpp"
#include "tidewire/core/transport/websocket_concept.hpp"
#include "tidewire/core/transport/telemetry/websocket.hpp"
#include "lcr/lockfree/spsc_ring.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast, TLS)
================================================================================

Single-connection transport primitive over Boost.Beast:

  - connect() starts the io thread and returns at once; resolve, TCP
    connect, TLS and WebSocket handshakes run as async operations on it under
    one deadline, and the outcome is reported as an Open event or as Error
    then Close
  - the io thread owns the io_context; connect, reads, writes and close are
    all executed on it, so the Beast stream is never touched concurrently
  - complete messages and control-plane events are handed to the driver
    through SPSC rings (receive thread produces, engine driver consumes)
  - close() is idempotent; Close is signaled exactly once

No retry, reconnection or subscription logic lives here. Only wss:// is
supported.
================================================================================
*/

namespace tidewire::core::transport::beast {

class WebSocket {
    using stream_type = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
    using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

public:
    explicit WebSocket(telemetry::WebSocket& telemetry);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Starts the connect sequence. Returns non-None only when the attempt
    // could not be started.
    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path,
                  std::chrono::milliseconds timeout) noexcept;

    // Queues a text frame for writing on the io thread.
    // Returns false when the socket is not open.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    void close() noexcept;

    [[nodiscard]]
    bool poll_message(std::string& out) noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    void on_resolve_(const boost::beast::error_code& ec, const boost::asio::ip::tcp::resolver::results_type& results) noexcept;
    void on_tcp_connect_(const boost::beast::error_code& ec) noexcept;
    void on_tls_handshake_(const boost::beast::error_code& ec) noexcept;
    void on_ws_handshake_(const boost::beast::error_code& ec) noexcept;
    void on_connect_deadline_(const boost::beast::error_code& ec) noexcept;
    void connect_failed_(Error err, std::string_view what) noexcept;

    void start_read_() noexcept;
    void on_read_(const boost::beast::error_code& ec, std::size_t bytes) noexcept;
    void start_write_() noexcept;
    void do_close_() noexcept;
    void fail_(Error err) noexcept;
    void signal_close_() noexcept;

    [[nodiscard]]
    static Error map_error_(const boost::beast::error_code& ec) noexcept;

private:
    telemetry::WebSocket& telemetry_;

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer connect_timer_;
    std::unique_ptr<stream_type> ws_;
    std::unique_ptr<work_guard_type> work_;
    std::thread io_thread_;

    std::string host_;
    std::string path_;
    std::chrono::milliseconds timeout_{0};

    boost::beast::flat_buffer rx_buffer_;
    std::deque<std::string> tx_queue_;      // io thread only

    std::atomic<bool> open_{false};
    std::atomic<bool> close_signaled_{false};
    bool connecting_{false};                // io thread only once started
    bool closing_{false};                   // io thread only

    lcr::lockfree::spsc_ring<std::string, config::TRANSPORT_MESSAGE_RING> messages_;
    lcr::lockfree::spsc_ring<websocket::Event, config::TRANSPORT_EVENT_RING> events_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace tidewire::core::transport::beast
