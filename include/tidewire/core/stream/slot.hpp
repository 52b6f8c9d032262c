#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tidewire/core/timestamp.hpp"
#include "tidewire/core/config/limits.hpp"
#include "tidewire/core/keepalive/watchdog.hpp"
#include "tidewire/core/protocol/codec_concept.hpp"
#include "tidewire/core/protocol/message.hpp"
#include "tidewire/core/protocol/result.hpp"
#include "tidewire/core/transport/error.hpp"
#include "tidewire/core/transport/parse_url.hpp"
#include "tidewire/core/transport/websocket_concept.hpp"
#include "tidewire/core/transport/websocket/events.hpp"
#include "tidewire/core/transport/telemetry/websocket.hpp"
#include "tidewire/core/stream/topic_set.hpp"
#include "tidewire/core/stream/subscription.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::stream {

/*
===============================================================================
 stream::ConnectionSlot<WS, Codec>
===============================================================================

One physical connection to an exchange endpoint, shared by every
subscription mapped to the same slot key.

  - Owns the transport instance of the current attempt (a fresh WS per
    connect) and the codec that decodes its traffic.
  - Keeps a refcounted set of wire topics. Subscribe / unsubscribe requests
    are queued on the 0 -> 1 and 1 -> 0 edges and sent by flush(), batched
    up to MAX_TOPICS_PER_REQUEST topics per control message.
  - Runs the keepalive watchdog while at least one subscriber is Active.
  - At most one connect attempt per driver step: later callers in the same
    step see the cached outcome.

Link
----
  Down --ensure_connected--> Opening --Open event--> Up
                                     --Error/Close--> Down (attempt failed)
  Up --disconnect--> Down

The transport runs the connect sequence on its own thread; the slot only
polls for the outcome, so no driver step ever waits on the network.

The slot has no view of subscription state; the engine interprets what the
slot reports. Driver thread only.
===============================================================================
*/
enum class Link : std::uint8_t {
    Down,
    Opening,
    Up
};

template <
    transport::WebSocketConcept WS,
    protocol::CodecConcept Codec
>
class ConnectionSlot {
public:
    ConnectionSlot(std::string key,
                   transport::ParsedUrl url,
                   transport::telemetry::WebSocket& telemetry,
                   std::chrono::milliseconds connect_timeout,
                   std::chrono::milliseconds ping_interval,
                   std::chrono::milliseconds pong_timeout) noexcept
        : key_(std::move(key))
        , url_(std::move(url))
        , telemetry_(telemetry)
        , connect_timeout_(connect_timeout)
        , keepalive_enabled_(ping_interval.count() > 0 && pong_timeout.count() > 0)
        , watchdog_(ping_interval, pong_timeout)
    {}

    ~ConnectionSlot() {
        disconnect();
    }

    ConnectionSlot(const ConnectionSlot&) = delete;
    ConnectionSlot& operator=(const ConnectionSlot&) = delete;

    // ------------------------------------------------------------------
    // Connection
    // ------------------------------------------------------------------

    // Starts a connect when Down, otherwise advances the one in flight.
    // Down with `err` set: the attempt failed during this step.
    [[nodiscard]]
    inline Link ensure_connected(std::uint64_t step, transport::Error& err) {
        err = transport::Error::None;
        if (link_ == Link::Up) {
            return Link::Up;
        }
        if (link_ == Link::Down) {
            if (last_attempt_step_ == step) {
                err = last_attempt_error_;
                return Link::Down;
            }
            last_attempt_step_ = step;
            ws_ = std::make_unique<WS>(telemetry_);
            TW_INFO("[SLOT] Connecting " << key_ << " (" << url_.host << ":" << url_.port << url_.path << ")");
            const auto started = ws_->connect(url_.host, url_.port, url_.path, connect_timeout_);
            if (started != transport::Error::None) {
                attempt_failed_(step, started);
                err = started;
                return Link::Down;
            }
            link_ = Link::Opening;
            open_error_ = transport::Error::None;
        }
        advance_open_(step);
        if (link_ == Link::Down) {
            err = last_attempt_error_;
        }
        return link_;
    }

    // Drops the transport and forgets every topic: the exchange side of the
    // subscriptions died with the socket.
    inline void disconnect() noexcept {
        if (ws_) {
            ws_->close();
            ws_.reset();
        }
        if (link_ == Link::Up) {
            TW_INFO("[SLOT] Disconnected " << key_ << " (epoch=" << epoch_ << ")");
        }
        link_ = Link::Down;
        topics_.clear();
        pending_.clear();
        watchdog_.disarm();
    }

    [[nodiscard]] inline bool connected() const noexcept { return link_ == Link::Up; }

    // ------------------------------------------------------------------
    // Topics
    // ------------------------------------------------------------------

    inline void acquire(const std::string& topic) {
        if (topics_.acquire(topic)) {
            pending_.push_back(Request{true, topic});
        }
    }

    inline void release(const std::string& topic) {
        if (topics_.release(topic) && link_ == Link::Up) {
            pending_.push_back(Request{false, topic});
        }
    }

    // Sends queued requests in order; consecutive requests of the same kind
    // share one control message.
    inline void flush() {
        if (pending_.empty()) {
            return;
        }
        if (link_ != Link::Up) {
            pending_.clear();
            return;
        }
        std::vector<std::string> batch;
        std::size_t i = 0;
        while (i < pending_.size()) {
            const bool subscribe = pending_[i].subscribe;
            batch.clear();
            while (i < pending_.size() && pending_[i].subscribe == subscribe && batch.size() < config::MAX_TOPICS_PER_REQUEST) {
                batch.push_back(std::move(pending_[i].topic));
                ++i;
            }
            const std::string msg = subscribe ? codec_.subscribe_request(batch) : codec_.unsubscribe_request(batch);
            if (!send_(msg)) {
                // The close event is already on its way; topics are dropped on disconnect
                break;
            }
            TW_DEBUG("[SLOT] " << (subscribe ? "Subscribe" : "Unsubscribe") << " sent on " << key_ << " (" << batch.size() << " topics)");
        }
        pending_.clear();
    }

    [[nodiscard]] inline const TopicSet& topics() const noexcept { return topics_; }

    // ------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------

    [[nodiscard]]
    inline bool poll_event(transport::websocket::Event& out) noexcept {
        return ws_ && ws_->poll_event(out);
    }

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        return ws_ && ws_->poll_message(out);
    }

    [[nodiscard]]
    inline protocol::Result decode(std::string_view raw, protocol::Message& out) noexcept {
        return codec_.decode(raw, out);
    }

    // ------------------------------------------------------------------
    // Keepalive
    // ------------------------------------------------------------------

    [[nodiscard]]
    inline keepalive::Action keepalive(TimePoint now, bool any_active) {
        if (!keepalive_enabled_ || link_ != Link::Up) {
            return keepalive::Action::None;
        }
        if (any_active) {
            watchdog_.arm(now);
        }
        else {
            watchdog_.disarm();
        }
        const auto action = watchdog_.poll(now);
        if (action == keepalive::Action::SendPing) {
            if (!send_(codec_.ping_request())) {
                TW_WARN("[SLOT] Ping could not be sent on " << key_);
            }
        }
        return action;
    }

    inline void on_pong(TimePoint now) noexcept {
        watchdog_.on_pong(now);
    }

    // ------------------------------------------------------------------
    // Subscribers
    // ------------------------------------------------------------------
    [[nodiscard]] inline std::set<SubscriptionId>& subscribers() noexcept { return subscribers_; }
    [[nodiscard]] inline const std::set<SubscriptionId>& subscribers() const noexcept { return subscribers_; }

    [[nodiscard]] inline const std::string& key() const noexcept { return key_; }

private:
    struct Request {
        bool subscribe;
        std::string topic;
    };

    // Consumes handshake events up to Open. Events after Open stay queued
    // for the engine.
    inline void advance_open_(std::uint64_t step) {
        transport::websocket::Event ev;
        while (ws_->poll_event(ev)) {
            switch (ev.type) {
                case transport::websocket::EventType::Open:
                    link_ = Link::Up;
                    consecutive_failures_ = 0;
                    ++epoch_;
                    TW_INFO("[SLOT] Connected " << key_ << " (epoch=" << epoch_ << ")");
                    return;
                case transport::websocket::EventType::Error:
                    open_error_ = ev.error;
                    break;
                case transport::websocket::EventType::Close:
                    attempt_failed_(step, open_error_ == transport::Error::None ? transport::Error::TransportFailure : open_error_);
                    return;
            }
        }
    }

    inline void attempt_failed_(std::uint64_t step, transport::Error err) {
        ++consecutive_failures_;
        TW_WARN("[SLOT] Connect failed for " << key_ << ": " << transport::to_string(err)
                << " (" << consecutive_failures_ << " in a row)");
        ws_->close();
        ws_.reset();
        link_ = Link::Down;
        last_attempt_step_ = step;
        last_attempt_error_ = err;
    }

    [[nodiscard]]
    inline bool send_(const std::string& msg) {
        if (!ws_) {
            return false;
        }
        return ws_->send(msg);
    }

private:
    std::string key_;
    transport::ParsedUrl url_;
    transport::telemetry::WebSocket& telemetry_;

    const std::chrono::milliseconds connect_timeout_;

    std::unique_ptr<WS> ws_;
    Codec codec_;

    Link link_{Link::Down};
    transport::Error open_error_{transport::Error::None};   // Error event seen while Opening
    std::uint64_t epoch_{0};                // successful connects
    std::uint32_t consecutive_failures_{0};

    std::uint64_t last_attempt_step_{0};
    transport::Error last_attempt_error_{transport::Error::None};

    TopicSet topics_;
    std::vector<Request> pending_;
    std::set<SubscriptionId> subscribers_;

    bool keepalive_enabled_;
    keepalive::Watchdog watchdog_;
};

} // namespace tidewire::core::stream
