#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tidewire/core/market/ticker.hpp"
#include "tidewire/core/market/trade.hpp"
#include "tidewire/core/market/kline.hpp"
#include "tidewire/core/book/update.hpp"

namespace tidewire::core::protocol {

enum class MessageKind : std::uint8_t {
    Ignored,
    Ticker,
    Trades,
    Klines,
    BookSnapshot,
    BookDiff,
    Pong,
    Ack,            // subscribe / unsubscribe accepted
    Rejection       // subscribe / unsubscribe refused
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::Ignored:      return "Ignored";
        case MessageKind::Ticker:       return "Ticker";
        case MessageKind::Trades:       return "Trades";
        case MessageKind::Klines:       return "Klines";
        case MessageKind::BookSnapshot: return "BookSnapshot";
        case MessageKind::BookDiff:     return "BookDiff";
        case MessageKind::Pong:         return "Pong";
        case MessageKind::Ack:          return "Ack";
        case MessageKind::Rejection:    return "Rejection";
        default:                        return "unknown";
    }
}

// -----------------------------------------------------------------------------
// Normalized inbound message produced by a codec.
//
// `topic` is the exchange wire topic the payload belongs to (empty for
// control messages). `text` carries the exchange's explanation for Ack and
// Rejection.
// -----------------------------------------------------------------------------
struct Message {
    using Payload = std::variant<
        std::monostate,
        market::Ticker,
        std::vector<market::Trade>,
        std::vector<market::Kline>,
        book::Update
    >;

    MessageKind kind{MessageKind::Ignored};
    std::string topic;
    std::string text;
    Payload     payload;

    inline void clear() noexcept {
        kind = MessageKind::Ignored;
        topic.clear();
        text.clear();
        payload = std::monostate{};
    }
};

} // namespace tidewire::core::protocol
