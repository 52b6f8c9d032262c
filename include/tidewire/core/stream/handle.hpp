#pragma once

#include <concepts>
#include <memory>
#include <mutex>
#include <stop_token>
#include <utility>

#include "tidewire/core/error.hpp"
#include "tidewire/core/channel/bounded.hpp"
#include "tidewire/core/channel/done.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "tidewire/core/protocol/topic.hpp"
#include "tidewire/core/stream/dispatcher.hpp"
#include "tidewire/core/stream/state.hpp"
#include "tidewire/core/stream/subscription.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::stream {

/*
===============================================================================
 stream::Stream<T>
===============================================================================

Caller-owned handle of one logical feed. Move-only; destroying a subscribed
handle unsubscribes it.

  subscribe(token, out)  Idle -> Connecting, hands out the data receiver.
                         Triggering `token` later cancels the subscription.
  unsubscribe()          closes the subscription with Unsubscribed. When it
                         returns both channels are closed and done has fired.
  errors(), done()       observers, valid from construction on
  state()                lock-free snapshot of the lifecycle state

All methods are thread-safe with respect to the engine driver.
===============================================================================
*/
template<Payload T>
class Stream {
public:
    using value_type = T;

    Stream() = default;

    Stream(std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<Subscription> sub, channel::Receiver<T> rx) noexcept
        : dispatcher_(std::move(dispatcher))
        , sub_(std::move(sub))
        , rx_(std::move(rx))
    {}

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    Stream(Stream&&) noexcept = default;

    Stream& operator=(Stream&& other) noexcept {
        if (this != &other) {
            release_();
            dispatcher_ = std::move(other.dispatcher_);
            sub_ = std::move(other.sub_);
            rx_ = std::move(other.rx_);
        }
        return *this;
    }

    ~Stream() {
        release_();
    }

    [[nodiscard]]
    inline Error subscribe(std::stop_token token, channel::Receiver<T>& out) {
        if (!sub_ || !dispatcher_) {
            return Error::StreamClosed;
        }
        if (sub_->wire_topic().empty()) {
            return Error::UnsupportedFeed;
        }
        State observed = State::Idle;
        if (!sub_->begin_subscribe(observed)) {
            return (observed == State::Closing || observed == State::Closed) ? Error::StreamClosed : Error::AlreadySubscribed;
        }
        // The stop callback is installed by the driver when it attaches the
        // subscription, under the driver lock like every other writer access
        if (!dispatcher_->post(Intent{IntentKind::Open, sub_->id(), sub_, std::move(token)})) {
            // Engine is gone: nobody will ever drive this subscription
            std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
            sub_->close(Error::EngineStopped);
            return Error::StreamClosed;
        }
        out = rx_;
        return Error::None;
    }

    [[nodiscard]]
    inline Error subscribe(channel::Receiver<T>& out) {
        return subscribe(std::stop_token{}, out);
    }

    [[nodiscard]]
    inline Error unsubscribe() {
        if (!sub_ || !dispatcher_) {
            return Error::NotSubscribed;
        }
        if (!is_live(sub_->state())) {
            return Error::NotSubscribed;
        }
        {
            std::lock_guard<std::mutex> lock(dispatcher_->driver_mutex());
            // Re-check under the writer lock: the driver may have closed it meanwhile
            if (!is_live(sub_->state())) {
                return Error::NotSubscribed;
            }
            sub_->close(Error::Unsubscribed);
        }
        (void)dispatcher_->post(Intent{IntentKind::Detach, sub_->id(), nullptr});
        return Error::None;
    }

    [[nodiscard]]
    inline channel::Receiver<StreamError> errors() const {
        return sub_ ? sub_->errors() : channel::Receiver<StreamError>{};
    }

    [[nodiscard]]
    inline channel::DoneSignal done() const {
        return sub_ ? sub_->done() : channel::DoneSignal{};
    }

    [[nodiscard]]
    inline State state() const noexcept {
        return sub_ ? sub_->state() : State::Closed;
    }

    [[nodiscard]]
    inline const protocol::Topic& topic() const noexcept {
        return sub_->topic();
    }

    // Exchange topic this handle maps to (empty when unsupported)
    [[nodiscard]]
    inline const std::string& wire_topic() const noexcept {
        return sub_->wire_topic();
    }

    [[nodiscard]]
    inline SubscriptionId id() const noexcept {
        return sub_ ? sub_->id() : 0;
    }

    // Latest published book, null until the first snapshot (order books only)
    [[nodiscard]]
    inline book::SnapshotPtr latest() const noexcept
        requires std::same_as<T, book::SnapshotPtr>
    {
        return sub_ ? sub_->latest() : book::SnapshotPtr{};
    }

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(sub_);
    }

private:
    inline void release_() noexcept {
        if (sub_ && is_live(sub_->state())) {
            const Error err = unsubscribe();
            if (err != Error::None) {
                TW_DEBUG("[SUB] Handle released while " << to_string(sub_->state()) << ": " << to_string(err));
            }
        }
    }

private:
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<Subscription> sub_;
    channel::Receiver<T> rx_;
};

} // namespace tidewire::core::stream
