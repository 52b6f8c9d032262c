#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "tidewire/core/error.hpp"
#include "tidewire/core/telemetry.hpp"
#include "tidewire/core/timestamp.hpp"
#include "tidewire/core/config/limits.hpp"
#include "tidewire/core/config/stream.hpp"
#include "tidewire/core/book/engine.hpp"
#include "tidewire/core/exchange/adapter_concept.hpp"
#include "tidewire/core/exchange/descriptor.hpp"
#include "tidewire/core/keepalive/watchdog.hpp"
#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"
#include "tidewire/core/protocol/message.hpp"
#include "tidewire/core/protocol/result.hpp"
#include "tidewire/core/protocol/topic.hpp"
#include "tidewire/core/transport/parse_url.hpp"
#include "tidewire/core/transport/telemetry/websocket.hpp"
#include "tidewire/core/transport/websocket/events.hpp"
#include "tidewire/core/stream/dispatcher.hpp"
#include "tidewire/core/stream/handle.hpp"
#include "tidewire/core/stream/slot.hpp"
#include "tidewire/core/stream/state.hpp"
#include "tidewire/core/stream/subscription.hpp"
#include "tidewire/core/stream/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::stream {

/*
===============================================================================
 stream::Engine<Adapter>
===============================================================================

Stream engine for one exchange. Creates caller handles, multiplexes their
topics over shared connection slots and drives every subscription through
its lifecycle.

Driver step (poll)
------------------
  1. Drain caller intents (open, detach, cancel)
  2. Per connected slot: drain inbound messages, decode and route them, then
     handle transport close / error events
  3. Per subscription: retry timers, connect timeouts, connects (started or
     advanced, never waited on), topic acquisition, activation (books: once
     the replica is valid)
  4. Per slot: keepalive (ping / pong timeout)
  5. Release closed subscriptions, tear down empty slots and unused books
  6. Flush queued subscribe / unsubscribe requests

Exactly one driver step runs at a time (dispatcher driver mutex). poll() can
be called from any thread, or start() runs it on an owned worker thread.

Resynchronization
-----------------
A sequence gap interrupts every subscriber of that book and releases its
topic. When the retry delay elapses the topic is acquired again, which
re-issues the exchange subscription on the live connection and yields a
fresh snapshot. A lost connection invalidates every book of the slot.

Destruction closes every subscription with EngineStopped. Handles may outlive
the engine; their calls then fail cleanly.
===============================================================================
*/
template<exchange::AdapterConcept Adapter>
class Engine {
    using transport_type = typename Adapter::transport_type;
    using codec_type     = typename Adapter::codec_type;
    using slot_type      = ConnectionSlot<transport_type, codec_type>;

public:
    // Validates the configuration and the descriptor endpoints.
    // Returns null with `err` set on failure.
    [[nodiscard]]
    static std::unique_ptr<Engine> create(const config::Stream& cfg, exchange::Descriptor descriptor, config::Error& err) {
        err = cfg.validate();
        if (err != config::Error::None) {
            TW_ERROR("[ENGINE] Invalid configuration: " << config::to_string(err));
            return nullptr;
        }
        if (!exchange::has_valid_endpoints(descriptor)) {
            err = config::Error::InvalidEndpoint;
            TW_ERROR("[ENGINE] Invalid endpoint for " << exchange::to_string(descriptor.provider));
            return nullptr;
        }
        return std::unique_ptr<Engine>(new Engine(cfg, std::move(descriptor)));
    }

    ~Engine() {
        stop();
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        auto pending = dispatcher_->shutdown();
        for (auto& intent : pending) {
            if (intent.kind == IntentKind::Open && intent.sub) {
                intent.sub->close(Error::EngineStopped);
            }
        }
        for (auto& [id, entry] : subs_) {
            entry.sub->close(Error::EngineStopped);
        }
        subs_.clear();
        slots_.clear();
        TW_INFO("[ENGINE] Stopped (" << exchange::to_string(descriptor_.provider) << ")");
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    // ------------------------------------------------------------------
    // Handle factories
    // ------------------------------------------------------------------

    [[nodiscard]]
    inline Stream<market::Ticker> ticker_stream(std::string_view symbol) {
        return make_stream_<market::Ticker>(protocol::Topic{protocol::FeedKind::Ticker, market::normalize_symbol(symbol), 0, market::KlineInterval::M1});
    }

    [[nodiscard]]
    inline Stream<book::SnapshotPtr> order_book_stream(std::string_view symbol, std::uint32_t depth = 50) {
        return make_stream_<book::SnapshotPtr>(protocol::Topic{protocol::FeedKind::OrderBook, market::normalize_symbol(symbol), depth, market::KlineInterval::M1});
    }

    [[nodiscard]]
    inline Stream<market::Trade> trade_stream(std::string_view symbol) {
        return make_stream_<market::Trade>(protocol::Topic{protocol::FeedKind::Trade, market::normalize_symbol(symbol), 0, market::KlineInterval::M1});
    }

    [[nodiscard]]
    inline Stream<market::Kline> kline_stream(std::string_view symbol, market::KlineInterval interval) {
        return make_stream_<market::Kline>(protocol::Topic{protocol::FeedKind::Kline, market::normalize_symbol(symbol), 0, interval});
    }

    // ------------------------------------------------------------------
    // Driving
    // ------------------------------------------------------------------

    // One driver step. Returns the number of inbound messages processed.
    inline std::size_t poll() {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        const TimePoint now = Clock::now();
        ++step_;

        process_intents_(now);

        std::size_t processed = 0;
        for (auto& [key, slot] : slots_) {
            processed += poll_slot_(*slot, now);
        }
        for (auto& [id, entry] : subs_) {
            drive_(entry, now);
        }
        for (auto& [key, slot] : slots_) {
            keepalive_(*slot, now);
        }
        cleanup_();
        for (auto& [key, slot] : slots_) {
            slot->flush();
        }
        return processed;
    }

    // Drives poll() until `token` is triggered
    inline void run(std::stop_token token) {
        TW_DEBUG("[ENGINE] Driver loop started");
        while (!token.stop_requested()) {
            if (poll() == 0) {
                std::this_thread::sleep_for(config::DRIVER_IDLE_SLEEP);
            }
        }
        TW_DEBUG("[ENGINE] Driver loop stopped");
    }

    // Runs the driver loop on an owned thread. False when already running.
    inline bool start() {
        if (worker_.joinable()) {
            return false;
        }
        worker_ = std::jthread([this](std::stop_token token) { run(token); });
        return true;
    }

    inline void stop() {
        if (worker_.joinable()) {
            worker_.request_stop();
            worker_.join();
        }
    }

    [[nodiscard]]
    inline bool running() const noexcept {
        return worker_.joinable();
    }

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]]
    inline std::size_t slot_count() const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        return slots_.size();
    }

    [[nodiscard]]
    inline std::size_t subscription_count() const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        return subs_.size();
    }

    [[nodiscard]]
    inline std::size_t book_count() const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        return books_.size();
    }

    [[nodiscard]] inline const config::Stream& config() const noexcept { return cfg_; }
    [[nodiscard]] inline const exchange::Descriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] inline const telemetry::Engine& telemetry() const noexcept { return telemetry_; }
    [[nodiscard]] inline const book::telemetry::Engine& book_metrics() const noexcept { return books_.metrics(); }
    [[nodiscard]] inline const transport::telemetry::WebSocket& transport_telemetry() const noexcept { return transport_telemetry_; }

#ifdef TW_UNIT_TEST
    // Slot keys currently alive, in key order
    [[nodiscard]]
    inline std::vector<std::string> slot_keys_for_test() const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        std::vector<std::string> out;
        for (const auto& [key, slot] : slots_) {
            out.push_back(key);
        }
        return out;
    }

    [[nodiscard]]
    inline bool book_valid_for_test(const std::string& wire_topic) const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        return books_.is_valid(wire_topic);
    }

    [[nodiscard]]
    inline bool book_exists_for_test(const std::string& wire_topic) const {
        std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
        return books_.contains(wire_topic);
    }
#endif

private:
    struct Entry {
        std::shared_ptr<Subscription> sub;
        std::string slot_key;
    };

    Engine(const config::Stream& cfg, exchange::Descriptor descriptor)
        : cfg_(cfg)
        , descriptor_(std::move(descriptor))
        , dispatcher_(std::make_shared<Dispatcher>())
        , books_(static_cast<std::size_t>(cfg.max_buffered_diffs))
    {
        TW_INFO("[ENGINE] Created (" << exchange::to_string(descriptor_.provider)
                << ", market=" << descriptor_.market_endpoint << ", depth=" << descriptor_.depth_endpoint << ")");
    }

    template<Payload T>
    [[nodiscard]]
    inline Stream<T> make_stream_(protocol::Topic topic) {
        std::string wire = codec_.topic_name(topic);
        if (wire.empty()) {
            TW_WARN("[ENGINE] Feed not supported by " << exchange::to_string(descriptor_.provider) << ": " << topic);
        }
        auto [sub, rx] = Subscription::create<T>(dispatcher_->next_id(), std::move(topic), std::move(wire), cfg_);
        return Stream<T>(dispatcher_, std::move(sub), std::move(rx));
    }

    [[nodiscard]]
    inline std::string slot_key_(const Subscription& sub) const {
        const auto cls = sub.topic().feed_class();
        std::string key = descriptor_.endpoint(cls);
        key += '|';
        key += protocol::to_string(cls);
        if (!descriptor_.combined_subscriptions) {
            key += '|';
            key += sub.wire_topic();
        }
        return key;
    }

    // ------------------------------------------------------------------
    // Intents
    // ------------------------------------------------------------------

    inline void process_intents_(TimePoint now) {
        dispatcher_->drain(intents_);
        for (auto& intent : intents_) {
            switch (intent.kind) {
                case IntentKind::Open:
                    attach_(std::move(intent.sub), std::move(intent.token), now);
                    break;
                case IntentKind::Detach:
                    // Already closed by the caller; released in cleanup_()
                    break;
                case IntentKind::Cancel: {
                    auto it = subs_.find(intent.id);
                    if (it != subs_.end() && is_live(it->second.sub->state())) {
                        it->second.sub->close(Error::Cancelled);
                    }
                    break;
                }
            }
        }
        intents_.clear();
    }

    inline void attach_(std::shared_ptr<Subscription> sub, std::stop_token token, TimePoint now) {
        if (!sub || !is_live(sub->state())) {
            return;
        }
        if (token.stop_requested()) {
            sub->close(Error::Cancelled);
            return;
        }
        std::string key = slot_key_(*sub);
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            transport::ParsedUrl url;
            const auto err = transport::parse_url(descriptor_.endpoint(sub->topic().feed_class()), url);
            if (err != transport::Error::None) {
                TW_ERROR("[ENGINE] Cannot open slot " << key << ": " << transport::to_string(err));
                sub->close(Error::ConnectFailed, transport::to_string(err));
                return;
            }
            auto slot = std::make_unique<slot_type>(key, std::move(url), transport_telemetry_,
                                                    cfg_.connect_timeout, cfg_.ping_interval, cfg_.pong_timeout);
            it = slots_.emplace(key, std::move(slot)).first;
            TW_TL1( telemetry_.slots_created_total.inc() );
            TW_DEBUG("[ENGINE] Slot created: " << key);
        }
        it->second->subscribers().insert(sub->id());
        sub->on_open(now);
        TW_TL1( telemetry_.subscriptions_opened_total.inc() );
        TW_INFO("[ENGINE] Subscription " << sub->id() << " attached to " << key << " (" << sub->wire_topic() << ")");
        const SubscriptionId id = sub->id();
        std::weak_ptr<Dispatcher> weak = dispatcher_;
        sub->watch_stop(std::move(token), [weak, id]() {
            if (auto d = weak.lock()) {
                (void)d->post(Intent{IntentKind::Cancel, id, nullptr, {}});
            }
        });
        subs_.emplace(id, Entry{std::move(sub), std::move(key)});
    }

    // ------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------

    inline std::size_t poll_slot_(slot_type& slot, TimePoint now) {
        if (!slot.connected()) {
            return 0;
        }
        bool closed = false;
        transport::websocket::Event ev;
        while (slot.poll_event(ev)) {
            switch (ev.type) {
                case transport::websocket::EventType::Error:
                    TW_WARN("[ENGINE] Transport error on " << slot.key() << ": " << transport::to_string(ev.error));
                    break;
                case transport::websocket::EventType::Close:
                    closed = true;
                    break;
                case transport::websocket::EventType::Open:
                    break;
            }
        }
        // Deliver whatever arrived before the close
        std::size_t processed = 0;
        while (slot.poll_message(raw_)) {
            ++processed;
            route_(slot, raw_, now);
        }
        if (closed) {
            connection_lost_(slot, Error::ConnectionLost, now, "transport closed");
        }
        return processed;
    }

    inline void route_(slot_type& slot, std::string_view raw, TimePoint now) {
        const auto r = slot.decode(raw, msg_);
        if (protocol::is_failure(r)) {
            TW_TL1( telemetry_.decode_failures_total.inc() );
            TW_WARN("[ENGINE] Decode failed on " << slot.key() << ": " << protocol::to_string(r));
            for (auto id : slot.subscribers()) {
                auto* e = find_(id);
                if (e && is_live(e->sub->state())) {
                    e->sub->emit_error(Error::DecodeFailed, protocol::to_string(r));
                }
            }
            return;
        }
        TW_TL2( telemetry_.messages_decoded_total.inc() );

        switch (msg_.kind) {
            case protocol::MessageKind::Ignored:
                break;

            case protocol::MessageKind::Ticker:
                deliver_(slot, std::get<market::Ticker>(msg_.payload));
                break;

            case protocol::MessageKind::Trades:
                for (const auto& trade : std::get<std::vector<market::Trade>>(msg_.payload)) {
                    deliver_(slot, trade);
                }
                break;

            case protocol::MessageKind::Klines:
                for (const auto& kline : std::get<std::vector<market::Kline>>(msg_.payload)) {
                    deliver_(slot, kline);
                }
                break;

            case protocol::MessageKind::BookSnapshot:
            case protocol::MessageKind::BookDiff:
                on_book_(slot, now);
                break;

            case protocol::MessageKind::Pong:
                slot.on_pong(now);
                break;

            case protocol::MessageKind::Ack:
                TW_DEBUG("[ENGINE] Request acknowledged on " << slot.key());
                break;

            case protocol::MessageKind::Rejection:
                on_rejection_(slot, now);
                break;
        }
    }

    // Ticker, trade and kline payloads go to Active subscribers of the topic
    template<Payload T>
    inline void deliver_(slot_type& slot, const T& item) {
        for (auto id : slot.subscribers()) {
            auto* e = find_(id);
            if (e && e->sub->state() == State::Active && e->sub->wire_topic() == msg_.topic) {
                e->sub->emit(item);
            }
        }
    }

    inline void on_book_(slot_type& slot, TimePoint now) {
        if (!has_topic_subscribers_(slot, msg_.topic)) {
            TW_TL1( telemetry_.book_messages_unrouted_total.inc() );
            TW_TRACE("[ENGINE] Book message without subscribers: " << msg_.topic);
            return;
        }
        const auto& update = std::get<book::Update>(msg_.payload);
        const auto outcome = (msg_.kind == protocol::MessageKind::BookSnapshot)
            ? books_.on_snapshot(msg_.topic, update)
            : books_.on_diff(msg_.topic, update);

        switch (outcome) {
            case book::Outcome::Applied: {
                auto snap = books_.latest(msg_.topic);
                for (auto id : slot.subscribers()) {
                    auto* e = find_(id);
                    if (e && e->sub->state() == State::Active && e->sub->wire_topic() == msg_.topic) {
                        e->sub->emit_snapshot(snap);
                    }
                }
                break;
            }

            case book::Outcome::Gap:
                for (auto id : slot.subscribers()) {
                    auto* e = find_(id);
                    if (!e || e->sub->wire_topic() != msg_.topic) {
                        continue;
                    }
                    auto& sub = *e->sub;
                    if (sub.state() == State::Active) {
                        release_(slot, sub);
                        sub.on_interrupted(Error::SequenceGap, now, "sequence gap");
                    }
                    else if (sub.state() == State::Connecting && sub.acquired()) {
                        release_(slot, sub);
                        sub.on_attempt_failed(Error::SequenceGap, now, "sequence gap");
                    }
                }
                break;

            case book::Outcome::Invalid:
                for (auto id : slot.subscribers()) {
                    auto* e = find_(id);
                    if (e && is_live(e->sub->state()) && e->sub->wire_topic() == msg_.topic) {
                        e->sub->emit_error(Error::InvalidBookData, protocol::to_string(msg_.kind));
                    }
                }
                break;

            case book::Outcome::Stale:
            case book::Outcome::Buffered:
                break;
        }
    }

    // Targets subscribers whose topic the exchange names, otherwise every
    // subscriber still waiting for its subscription.
    inline void on_rejection_(slot_type& slot, TimePoint now) {
        TW_TL1( telemetry_.rejections_total.inc() );
        TW_WARN("[ENGINE] Request rejected on " << slot.key() << ": " << msg_.text);

        std::vector<Subscription*> targets;
        for (auto id : slot.subscribers()) {
            auto* e = find_(id);
            if (e && is_live(e->sub->state()) && names_topic_(msg_.text, e->sub->wire_topic())) {
                targets.push_back(e->sub.get());
            }
        }
        if (targets.empty()) {
            for (auto id : slot.subscribers()) {
                auto* e = find_(id);
                if (e && e->sub->state() == State::Connecting && e->sub->acquired()) {
                    targets.push_back(e->sub.get());
                }
            }
        }
        for (auto* sub : targets) {
            if (sub->state() == State::Connecting) {
                release_(slot, *sub);
                sub->on_attempt_failed(Error::SubscriptionRejected, now, msg_.text);
            }
            else {
                sub->emit_error(Error::SubscriptionRejected, msg_.text);
            }
        }
    }

    // Whole-token match: "tickers.BTC" is not named by "tickers.BTCUSDT"
    [[nodiscard]]
    static inline bool names_topic_(std::string_view text, std::string_view topic) noexcept {
        if (topic.empty()) {
            return false;
        }
        const auto is_topic_char = [](char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        };
        for (auto pos = text.find(topic); pos != std::string_view::npos; pos = text.find(topic, pos + 1)) {
            const auto end = pos + topic.size();
            const bool left_ok = (pos == 0) || !is_topic_char(text[pos - 1]);
            const bool right_ok = (end == text.size()) || !is_topic_char(text[end]);
            if (left_ok && right_ok) {
                return true;
            }
        }
        return false;
    }

    // ------------------------------------------------------------------
    // Connection loss
    // ------------------------------------------------------------------

    inline void connection_lost_(slot_type& slot, Error reason, TimePoint now, std::string_view detail) {
        TW_TL1( telemetry_.connections_lost_total.inc() );
        TW_WARN("[ENGINE] Connection lost on " << slot.key() << ": " << to_string(reason));
        slot.disconnect();
        for (auto id : slot.subscribers()) {
            auto* e = find_(id);
            if (!e) {
                continue;
            }
            auto& sub = *e->sub;
            sub.set_acquired(false);
            if (sub.topic().is_book()) {
                books_.invalidate(sub.wire_topic());
            }
            if (sub.state() == State::Active) {
                sub.on_interrupted(reason, now, detail);
            }
            else if (sub.state() == State::Connecting) {
                sub.on_attempt_failed(Error::ConnectionLost, now, detail);
            }
        }
    }

    inline void keepalive_(slot_type& slot, TimePoint now) {
        if (!slot.connected()) {
            return;
        }
        bool any_active = false;
        for (auto id : slot.subscribers()) {
            auto* e = find_(id);
            if (e && e->sub->state() == State::Active) {
                any_active = true;
                break;
            }
        }
        switch (slot.keepalive(now, any_active)) {
            case keepalive::Action::SendPing:
                TW_TL1( telemetry_.pings_sent_total.inc() );
                TW_TRACE("[ENGINE] Ping sent on " << slot.key());
                break;
            case keepalive::Action::Unhealthy:
                TW_TL1( telemetry_.pong_timeouts_total.inc() );
                connection_lost_(slot, Error::PongTimeout, now, "no pong within timeout");
                break;
            case keepalive::Action::None:
                break;
        }
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    inline void drive_(Entry& entry, TimePoint now) {
        auto& sub = *entry.sub;
        if (sub.state() == State::Reconnecting) {
            if (!sub.on_retry_timer(now)) {
                return;
            }
            TW_TL1( telemetry_.retries_total.inc() );
        }
        if (sub.state() == State::Connecting) {
            connecting_(entry, now);
        }
    }

    inline void connecting_(Entry& entry, TimePoint now) {
        auto& sub = *entry.sub;
        auto it = slots_.find(entry.slot_key);
        if (it == slots_.end()) {
            return;
        }
        auto& slot = *it->second;

        if (sub.connect_expired(now)) {
            release_(slot, sub);
            sub.on_attempt_failed(Error::ConnectTimeout, now, "active not reached in time");
            return;
        }
        if (!slot.connected()) {
            transport::Error err = transport::Error::None;
            switch (slot.ensure_connected(step_, err)) {
                case Link::Up:
                    break;
                case Link::Opening:
                    // Handshake in flight; bounded by the connect deadline
                    return;
                case Link::Down:
                    sub.on_attempt_failed(Error::ConnectFailed, now, transport::to_string(err));
                    return;
            }
        }
        if (!sub.acquired()) {
            slot.acquire(sub.wire_topic());
            sub.set_acquired(true);
        }
        if (!sub.topic().is_book()) {
            sub.on_activated();
            return;
        }
        if (books_.is_valid(sub.wire_topic())) {
            sub.on_activated();
            sub.emit_snapshot(books_.latest(sub.wire_topic()));
        }
    }

    inline void release_(slot_type& slot, Subscription& sub) {
        if (sub.acquired()) {
            slot.release(sub.wire_topic());
            sub.set_acquired(false);
        }
    }

    // Detaches closed subscriptions, destroys empty slots and unused books
    inline void cleanup_() {
        for (auto it = subs_.begin(); it != subs_.end(); ) {
            auto& sub = *it->second.sub;
            if (sub.state() != State::Closed) {
                ++it;
                continue;
            }
            auto sit = slots_.find(it->second.slot_key);
            if (sit != slots_.end()) {
                release_(*sit->second, sub);
                sit->second->subscribers().erase(sub.id());
                if (sit->second->subscribers().empty()) {
                    TW_DEBUG("[ENGINE] Slot destroyed: " << sit->first);
                    slots_.erase(sit);
                }
            }
            const std::string wire = sub.wire_topic();
            const bool book = sub.topic().is_book();
            TW_TL1( telemetry_.subscriptions_closed_total.inc() );
            it = subs_.erase(it);
            if (book && !has_book_subscribers_(wire)) {
                books_.erase(wire);
            }
        }
    }

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    [[nodiscard]]
    inline Entry* find_(SubscriptionId id) noexcept {
        auto it = subs_.find(id);
        return it == subs_.end() ? nullptr : &it->second;
    }

    [[nodiscard]]
    inline bool has_topic_subscribers_(const slot_type& slot, const std::string& wire) const noexcept {
        for (auto id : slot.subscribers()) {
            auto it = subs_.find(id);
            if (it != subs_.end() && it->second.sub->wire_topic() == wire && is_live(it->second.sub->state())) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline bool has_book_subscribers_(const std::string& wire) const noexcept {
        for (const auto& [id, entry] : subs_) {
            if (entry.sub->wire_topic() == wire) {
                return true;
            }
        }
        return false;
    }

private:
    const config::Stream cfg_;
    const exchange::Descriptor descriptor_;

    std::shared_ptr<Dispatcher> dispatcher_;
    codec_type codec_;              // topic names only; slots decode with their own codec

    std::map<SubscriptionId, Entry> subs_;
    std::map<std::string, std::unique_ptr<slot_type>> slots_;
    book::Engine books_;

    transport::telemetry::WebSocket transport_telemetry_;
    telemetry::Engine telemetry_;

    std::uint64_t step_{0};
    std::vector<Intent> intents_;
    std::string raw_;
    protocol::Message msg_;

    std::jthread worker_;           // declared last: joined first
};

} // namespace tidewire::core::stream
