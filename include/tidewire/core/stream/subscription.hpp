#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "tidewire/core/error.hpp"
#include "tidewire/core/timestamp.hpp"
#include "tidewire/core/config/limits.hpp"
#include "tidewire/core/config/stream.hpp"
#include "tidewire/core/channel/bounded.hpp"
#include "tidewire/core/channel/done.hpp"
#include "tidewire/core/backoff/controller.hpp"
#include "tidewire/core/book/publisher.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "tidewire/core/market/ticker.hpp"
#include "tidewire/core/market/trade.hpp"
#include "tidewire/core/market/kline.hpp"
#include "tidewire/core/protocol/topic.hpp"
#include "tidewire/core/stream/state.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::stream {

using SubscriptionId = std::uint64_t;

// Payload types a subscription can deliver
template<typename T>
concept Payload =
    std::same_as<T, market::Ticker> ||
    std::same_as<T, market::Trade> ||
    std::same_as<T, market::Kline> ||
    std::same_as<T, book::SnapshotPtr>;

/*
===============================================================================
 stream::Subscription
===============================================================================

Control block of one logical feed, shared between the caller's Stream<T>
handle and the engine.

Ownership
---------
  - The Senders (data, error) and the DoneTrigger live here and are only ever
    touched by the single writer: whoever holds the dispatcher's driver mutex.
  - The caller keeps the Receivers and the DoneSignal.
  - close() consumes both Senders and fires done, in that order, exactly once.

State machine
-------------
  Idle --SubscribeRequested--> Connecting
  Connecting --Activated--> Active                 (backoff reset)
  Connecting --AttemptFailed--> Reconnecting       (attempt counted)
                            --> Closed             (exhausted / reconnect off)
  Active --Interrupted--> Reconnecting             (not counted)
                      --> Closed                   (reconnect off)
  Reconnecting --RetryTimerExpired--> Connecting
  any --CloseRequested--> Closing --> Closed

The state is atomic so handles can read it without the driver lock. Only
the Idle -> Connecting edge is taken by the caller (compare-exchange); every
other edge is taken by the writer.
===============================================================================
*/
class Subscription {
public:
    template<Payload T>
    [[nodiscard]]
    static std::pair<std::shared_ptr<Subscription>, channel::Receiver<T>>
    create(SubscriptionId id, protocol::Topic topic, std::string wire_topic, const config::Stream& cfg) {
        auto sub = std::shared_ptr<Subscription>(new Subscription(id, std::move(topic), std::move(wire_topic), cfg));
        auto [tx, rx] = channel::make<T>(static_cast<std::size_t>(cfg.buffer_size));
        sub->data_ = std::move(tx);
        return { std::move(sub), std::move(rx) };
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // ------------------------------------------------------------------
    // Identity
    // ------------------------------------------------------------------
    [[nodiscard]] inline SubscriptionId id() const noexcept { return id_; }
    [[nodiscard]] inline const protocol::Topic& topic() const noexcept { return topic_; }
    [[nodiscard]] inline const std::string& wire_topic() const noexcept { return wire_topic_; }

    [[nodiscard]]
    inline State state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline channel::Receiver<StreamError> errors() const { return errors_rx_; }
    [[nodiscard]] inline channel::DoneSignal done() const { return done_rx_; }
    [[nodiscard]] inline book::SnapshotPtr latest() const noexcept { return publisher_.load(); }

    // ------------------------------------------------------------------
    // Caller side
    // ------------------------------------------------------------------

    // Idle -> Connecting. On failure `observed` holds the state that blocked it.
    [[nodiscard]]
    inline bool begin_subscribe(State& observed) noexcept {
        State expected = State::Idle;
        if (!state_.compare_exchange_strong(expected, State::Connecting, std::memory_order_acq_rel)) {
            observed = expected;
            return false;
        }
        TW_TRACE("[FSM] (Idle) --" << to_string(Event::SubscribeRequested) << "--> sub=" << id_);
        TW_DEBUG("[SUB] State: Idle -> Connecting (sub=" << id_ << ", " << wire_topic_ << ")");
        return true;
    }

    // ------------------------------------------------------------------
    // Writer side (driver lock held)
    // ------------------------------------------------------------------

    // The callback runs on whichever thread requests the stop, possibly
    // immediately. It must not take the driver lock.
    inline void watch_stop(std::stop_token token, std::function<void()> on_stop) {
        if (!token.stop_possible() || !is_live(state())) {
            return;
        }
        stop_cb_ = std::make_unique<std::stop_callback<std::function<void()>>>(std::move(token), std::move(on_stop));
    }

    inline void on_open(TimePoint now) noexcept {
        connect_deadline_ = now + connect_timeout_;
    }

    inline void on_activated() {
        transition_(Event::Activated, Error::None, TimePoint{}, {});
    }

    inline void on_attempt_failed(Error reason, TimePoint now, std::string_view detail = {}) {
        transition_(Event::AttemptFailed, reason, now, detail);
    }

    inline void on_interrupted(Error reason, TimePoint now, std::string_view detail = {}) {
        transition_(Event::Interrupted, reason, now, detail);
    }

    // Reconnecting -> Connecting once the backoff delay elapsed
    inline bool on_retry_timer(TimePoint now) {
        if (state() != State::Reconnecting || !backoff_.ready(now)) {
            return false;
        }
        transition_(Event::RetryTimerExpired, Error::None, now, {});
        return true;
    }

    // Delivers `terminal` as the last error, closes both channels and fires
    // done. No-op once Closed.
    inline void close(Error terminal, std::string_view detail = {}) {
        transition_(Event::CloseRequested, terminal, TimePoint{}, detail);
    }

    template<Payload T>
    inline void emit(const T& item) {
        if (auto* tx = std::get_if<channel::Sender<T>>(&data_)) {
            if (!tx->emit(item)) {
                TW_TRACE("[SUB] Dropped item on hand-off channel (sub=" << id_ << ")");
            }
        }
    }

    // Book feeds: publish for latest() and deliver on the data channel
    inline void emit_snapshot(const book::SnapshotPtr& snap) {
        publisher_.publish(snap);
        emit(snap);
    }

    // Non-terminal diagnostics, dropped silently on overflow
    inline void emit_error(Error code, std::string_view detail = {}) {
        if (!errors_tx_.valid()) {
            return;
        }
        (void)errors_tx_.emit(StreamError{code, wire_topic_, std::string(detail)});
    }

    // ------------------------------------------------------------------
    // Driver bookkeeping
    // ------------------------------------------------------------------
    [[nodiscard]] inline bool acquired() const noexcept { return acquired_; }
    inline void set_acquired(bool v) noexcept { acquired_ = v; }

    [[nodiscard]] inline bool connect_expired(TimePoint now) const noexcept { return now >= connect_deadline_; }
    [[nodiscard]] inline const backoff::Controller& backoff() const noexcept { return backoff_; }

private:
    Subscription(SubscriptionId id, protocol::Topic topic, std::string wire_topic, const config::Stream& cfg)
        : id_(id)
        , topic_(std::move(topic))
        , wire_topic_(std::move(wire_topic))
        , reconnect_(cfg.reconnect)
        , connect_timeout_(cfg.connect_timeout)
        , backoff_(backoff::Policy{cfg.base_delay, cfg.max_delay, cfg.max_reconnect_attempts})
    {
        auto [etx, erx] = channel::make<StreamError>(config::ERROR_CHANNEL_CAPACITY);
        errors_tx_ = std::move(etx);
        errors_rx_ = std::move(erx);
        auto [trigger, signal] = channel::make_done();
        done_tx_ = std::move(trigger);
        done_rx_ = std::move(signal);
    }

    inline void set_state_(State new_state) noexcept {
        TW_DEBUG("[SUB] State: " << to_string(state()) << " -> " << to_string(new_state) << " (sub=" << id_ << ", " << wire_topic_ << ")");
        state_.store(new_state, std::memory_order_release);
    }

    // Failure while Connecting (counted) or Active (not counted)
    inline void enter_retry_(Error reason, TimePoint now, std::string_view detail, bool count_attempt) {
        // Connectivity and consistency failures surface as state transitions only
        if (error_class_of(reason) == ErrorClass::Protocol) {
            emit_error(reason, detail);
        }
        if (!reconnect_) {
            close_(Error::ReconnectDisabled, to_string(reason));
            return;
        }
        if (count_attempt) {
            backoff_.record_failure();
            if (backoff_.exhausted()) {
                TW_WARN("[SUB] Giving up on " << wire_topic_ << " after " << backoff_.attempts() << " attempts (last: " << to_string(reason) << ")");
                close_(Error::ReconnectExhausted, to_string(reason));
                return;
            }
        }
        set_state_(State::Reconnecting);
        backoff_.schedule(now);
        TW_DEBUG("[SUB] Retry for " << wire_topic_ << " in " << backoff_.last_delay().count() << " ms (attempt " << backoff_.attempts() << ")");
    }

    inline void close_(Error terminal, std::string_view detail) {
        set_state_(State::Closing);
        stop_cb_.reset();
        std::visit([](auto& tx) {
            if constexpr (!std::is_same_v<std::decay_t<decltype(tx)>, std::monostate>) {
                std::move(tx).close();
            }
        }, data_);
        data_ = std::monostate{};
        std::move(errors_tx_).close_with(StreamError{terminal, wire_topic_, std::string(detail)});
        publisher_.reset();
        set_state_(State::Closed);
        std::move(done_tx_).fire();
        TW_INFO("[SUB] Closed " << wire_topic_ << " (sub=" << id_ << "): " << to_string(terminal));
    }

    // State machine transition function
    inline void transition_(Event event, Error error, TimePoint now, std::string_view detail) {
        const State state = this->state();

        TW_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "--> sub=" << id_);

        switch (state) {

        // ================================================================
        case State::Idle:
            switch (event) {
            case Event::CloseRequested:
                close_(error, detail);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::Activated:
                set_state_(State::Active);
                backoff_.reset();
                break;

            case Event::AttemptFailed:
                enter_retry_(error, now, detail, true);
                break;

            case Event::CloseRequested:
                close_(error, detail);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Active:
            switch (event) {
            case Event::Interrupted:
                enter_retry_(error, now, detail, false);
                break;

            case Event::CloseRequested:
                close_(error, detail);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                connect_deadline_ = now + connect_timeout_;
                break;

            case Event::CloseRequested:
                close_(error, detail);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Closing:
        case State::Closed:
            break;
        }
    }

private:
    const SubscriptionId id_;
    const protocol::Topic topic_;
    const std::string wire_topic_;
    const bool reconnect_;
    const std::chrono::milliseconds connect_timeout_;

    std::atomic<State> state_{State::Idle};

    std::variant<
        std::monostate,
        channel::Sender<market::Ticker>,
        channel::Sender<market::Trade>,
        channel::Sender<market::Kline>,
        channel::Sender<book::SnapshotPtr>
    > data_;
    channel::Sender<StreamError> errors_tx_;
    channel::Receiver<StreamError> errors_rx_;
    channel::DoneTrigger done_tx_;
    channel::DoneSignal done_rx_;

    book::Publisher publisher_;
    backoff::Controller backoff_;

    bool acquired_{false};              // topic held in the slot's topic set
    TimePoint connect_deadline_{};

    std::unique_ptr<std::stop_callback<std::function<void()>>> stop_cb_;
};

} // namespace tidewire::core::stream
