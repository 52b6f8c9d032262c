#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tidewire/core/protocol/bybit/helpers.hpp"
#include "tidewire/core/protocol/codec_concept.hpp"
#include "tidewire/core/protocol/message.hpp"
#include "tidewire/core/protocol/result.hpp"
#include "tidewire/core/protocol/topic.hpp"
#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/market/types.hpp"
#include "tidewire/core/timestamp.hpp"

#include "simdjson.h"

/*
================================================================================
Bybit v5 public stream codec
================================================================================

Wire topics:
  tickers.{SYMBOL}
  orderbook.{depth}.{SYMBOL}      depth in {1, 50, 200}
  publicTrade.{SYMBOL}
  kline.{interval}.{SYMBOL}       interval in {1,3,5,15,30,60,120,240,360,720,D,W,M}

Control messages:
  {"op":"subscribe","args":[...]}
  {"op":"unsubscribe","args":[...]}
  {"op":"ping"}

Order-book messages carry a single update id `u`. Snapshots set the watermark
to `u`; a delta covers exactly [u, u].

The codec owns a simdjson DOM parser and is therefore not thread-safe. One
codec instance is used per connection slot.
================================================================================
*/

namespace tidewire::core::protocol::bybit {

// ----------------------------------------------------------------------------
// Kline interval <-> Bybit interval token. 8h and 3d are not offered.
// ----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view interval_token(market::KlineInterval i) noexcept {
    using market::KlineInterval;
    switch (i) {
        case KlineInterval::M1:     return "1";
        case KlineInterval::M3:     return "3";
        case KlineInterval::M5:     return "5";
        case KlineInterval::M15:    return "15";
        case KlineInterval::M30:    return "30";
        case KlineInterval::H1:     return "60";
        case KlineInterval::H2:     return "120";
        case KlineInterval::H4:     return "240";
        case KlineInterval::H6:     return "360";
        case KlineInterval::H12:    return "720";
        case KlineInterval::D1:     return "D";
        case KlineInterval::W1:     return "W";
        case KlineInterval::Month1: return "M";
        default:                    return {};
    }
}

[[nodiscard]]
inline bool parse_interval_token(std::string_view token, market::KlineInterval& out) noexcept {
    using market::KlineInterval;
    constexpr KlineInterval all[] = {
        KlineInterval::M1, KlineInterval::M3, KlineInterval::M5, KlineInterval::M15, KlineInterval::M30,
        KlineInterval::H1, KlineInterval::H2, KlineInterval::H4, KlineInterval::H6, KlineInterval::H12,
        KlineInterval::D1, KlineInterval::W1, KlineInterval::Month1
    };
    for (auto i : all) {
        if (interval_token(i) == token) {
            out = i;
            return true;
        }
    }
    return false;
}

[[nodiscard]]
inline constexpr bool is_supported_depth(std::uint32_t depth) noexcept {
    return depth == 1 || depth == 50 || depth == 200;
}


class Codec {
public:
    Codec() = default;

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    // ------------------------------------------------------------------
    // Outbound
    // ------------------------------------------------------------------

    // Empty when the topic cannot be expressed on Bybit
    [[nodiscard]]
    std::string topic_name(const Topic& topic) const {
        if (!market::is_valid_symbol(topic.symbol)) {
            return {};
        }
        switch (topic.kind) {
            case FeedKind::Ticker:
                return "tickers." + topic.symbol;
            case FeedKind::Trade:
                return "publicTrade." + topic.symbol;
            case FeedKind::OrderBook:
                if (!is_supported_depth(topic.depth)) {
                    return {};
                }
                return "orderbook." + std::to_string(topic.depth) + "." + topic.symbol;
            case FeedKind::Kline: {
                const auto token = interval_token(topic.interval);
                if (token.empty()) {
                    return {};
                }
                return "kline." + std::string(token) + "." + topic.symbol;
            }
        }
        return {};
    }

    [[nodiscard]]
    std::string subscribe_request(const std::vector<std::string>& topics) const {
        return build_request_("subscribe", topics);
    }

    [[nodiscard]]
    std::string unsubscribe_request(const std::vector<std::string>& topics) const {
        return build_request_("unsubscribe", topics);
    }

    [[nodiscard]]
    std::string ping_request() const {
        return R"({"op":"ping"})";
    }

    // ------------------------------------------------------------------
    // Inbound
    // ------------------------------------------------------------------

    [[nodiscard]]
    Result decode(std::string_view raw, Message& out) noexcept {
        out.clear();
        simdjson::dom::element root;
        if (parser_.parse(raw.data(), raw.size()).get(root)) {
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (helper::has_field(root, "op")) {
            return decode_control_(root, out);
        }
        if (helper::has_field(root, "topic")) {
            return decode_data_(root, out);
        }
        return Result::Ignored;
    }

private:
    [[nodiscard]]
    static std::string build_request_(std::string_view op, const std::vector<std::string>& topics) {
        std::string msg;
        msg.reserve(32 + topics.size() * 32);
        msg += R"({"op":")";
        msg += op;
        msg += R"(","args":[)";
        for (std::size_t i = 0; i < topics.size(); ++i) {
            if (i > 0) msg += ',';
            msg += '"';
            msg += topics[i];
            msg += '"';
        }
        msg += "]}";
        return msg;
    }

    // {"success":true,"ret_msg":"pong","conn_id":"...","op":"ping"}
    // {"op":"pong","args":["1700000000000"],"conn_id":"..."}
    // {"success":false,"ret_msg":"error:...","conn_id":"...","op":"subscribe"}
    [[nodiscard]]
    static Result decode_control_(const simdjson::dom::element& root, Message& out) noexcept {
        std::string_view op;
        if (helper::parse_string_required(root, "op", op) != Result::Ok) {
            return Result::InvalidSchema;
        }
        std::string_view ret_msg;
        bool has_ret_msg = false;
        if (helper::parse_string_optional(root, "ret_msg", ret_msg, has_ret_msg) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (op == "pong" || (op == "ping" && has_ret_msg && ret_msg == "pong")) {
            out.kind = MessageKind::Pong;
            return Result::Ok;
        }
        if (op == "subscribe" || op == "unsubscribe") {
            bool success = false;
            if (helper::parse_bool_required(root, "success", success) != Result::Ok) {
                return Result::InvalidSchema;
            }
            out.kind = success ? MessageKind::Ack : MessageKind::Rejection;
            out.text = std::string(ret_msg);
            return Result::Ok;
        }
        return Result::Ignored;
    }

    [[nodiscard]]
    static Result decode_data_(const simdjson::dom::element& root, Message& out) noexcept {
        std::string_view topic;
        if (helper::parse_string_required(root, "topic", topic) != Result::Ok) {
            return Result::InvalidSchema;
        }
        if (topic.starts_with("orderbook.")) {
            return decode_book_(root, topic, out);
        }
        if (topic.starts_with("tickers.")) {
            return decode_ticker_(root, topic, out);
        }
        if (topic.starts_with("publicTrade.")) {
            return decode_trades_(root, topic, out);
        }
        if (topic.starts_with("kline.")) {
            return decode_klines_(root, topic, out);
        }
        return Result::Ignored;
    }

    // {"topic":"orderbook.50.BTCUSDT","type":"snapshot","ts":1672304484978,
    //  "data":{"s":"BTCUSDT","b":[["16493.50","0.006"]],"a":[["16611.00","0.029"]],"u":18521288,"seq":7961638724}}
    [[nodiscard]]
    static Result decode_book_(const simdjson::dom::element& root, std::string_view topic, Message& out) noexcept {
        std::string_view type;
        if (helper::parse_string_required(root, "type", type) != Result::Ok) {
            return Result::InvalidSchema;
        }
        MessageKind kind;
        if (type == "snapshot") {
            kind = MessageKind::BookSnapshot;
        }
        else if (type == "delta") {
            kind = MessageKind::BookDiff;
        }
        else {
            return Result::InvalidValue;
        }
        std::uint64_t ts = 0;
        if (helper::parse_uint64_required(root, "ts", ts) != Result::Ok) {
            return Result::InvalidSchema;
        }
        simdjson::dom::element data;
        if (helper::parse_object_required(root, "data", data) != Result::Ok) {
            return Result::InvalidSchema;
        }

        book::Update update;
        std::string_view symbol;
        auto r = helper::parse_string_required(data, "s", symbol);
        if (r != Result::Ok) return r;
        r = helper::parse_levels(data, "b", update.bids);
        if (r != Result::Ok) return r;
        r = helper::parse_levels(data, "a", update.asks);
        if (r != Result::Ok) return r;
        std::uint64_t u = 0;
        r = helper::parse_uint64_required(data, "u", u);
        if (r != Result::Ok) return r;
        std::uint64_t seq = 0;
        if (helper::has_field(data, "seq")) {
            r = helper::parse_uint64_required(data, "seq", seq);
            if (r != Result::Ok) return r;
        }

        update.symbol = std::string(symbol);
        update.first_update_id = u;
        update.final_update_id = u;
        update.exchange_seq = seq;
        update.timestamp = from_epoch_ms(static_cast<std::int64_t>(ts));

        out.kind = kind;
        out.topic = std::string(topic);
        out.payload = std::move(update);
        return Result::Ok;
    }

    // {"topic":"tickers.BTCUSDT","ts":1673853746003,"type":"snapshot",
    //  "data":{"symbol":"BTCUSDT","lastPrice":"21109.77","highPrice24h":"21426.99",...}}
    [[nodiscard]]
    static Result decode_ticker_(const simdjson::dom::element& root, std::string_view topic, Message& out) noexcept {
        simdjson::dom::element data;
        if (helper::parse_object_required(root, "data", data) != Result::Ok) {
            return Result::InvalidSchema;
        }
        market::Ticker t;
        std::string_view symbol;
        if (helper::parse_string_required(data, "symbol", symbol) != Result::Ok) {
            return Result::InvalidSchema;
        }
        t.symbol = std::string(symbol);

        double prev_price = 0.0;
        double change_ratio = 0.0;
        const std::pair<const char*, double*> fields[] = {
            {"lastPrice",    &t.last_price},
            {"highPrice24h", &t.high_24h},
            {"lowPrice24h",  &t.low_24h},
            {"volume24h",    &t.volume_24h},
            {"turnover24h",  &t.quote_volume_24h},
            {"prevPrice24h", &prev_price},
            {"price24hPcnt", &change_ratio},
            {"bid1Price",    &t.bid_price},
            {"bid1Size",     &t.bid_qty},
            {"ask1Price",    &t.ask_price},
            {"ask1Size",     &t.ask_qty}
        };
        for (const auto& [key, dst] : fields) {
            auto r = helper::parse_decimal_optional(data, key, *dst);
            if (r != Result::Ok) {
                return r;
            }
        }
        if (prev_price > 0.0 && t.last_price > 0.0) {
            t.price_change = t.last_price - prev_price;
        }
        t.price_change_percent = change_ratio * 100.0;

        std::uint64_t ts = 0;
        if (helper::parse_uint64_required(root, "ts", ts) == Result::Ok) {
            t.timestamp = from_epoch_ms(static_cast<std::int64_t>(ts));
        }

        out.kind = MessageKind::Ticker;
        out.topic = std::string(topic);
        out.payload = std::move(t);
        return Result::Ok;
    }

    // {"topic":"publicTrade.BTCUSDT","type":"snapshot","ts":1672304486868,
    //  "data":[{"T":1672304486865,"s":"BTCUSDT","S":"Buy","v":"0.001","p":"16578.50","i":"20f43950-...","BT":false}]}
    [[nodiscard]]
    static Result decode_trades_(const simdjson::dom::element& root, std::string_view topic, Message& out) noexcept {
        simdjson::dom::array data;
        if (helper::parse_array_required(root, "data", data) != Result::Ok) {
            return Result::InvalidSchema;
        }
        std::vector<market::Trade> trades;
        trades.reserve(data.size());
        for (auto item : data) {
            if (helper::require_object(item) != Result::Ok) {
                return Result::InvalidSchema;
            }
            market::Trade trade;
            std::string_view id;
            std::string_view symbol;
            std::string_view side;
            std::uint64_t ts = 0;
            auto r = helper::parse_string_required(item, "i", id);
            if (r != Result::Ok) return r;
            r = helper::parse_string_required(item, "s", symbol);
            if (r != Result::Ok) return r;
            r = helper::parse_string_required(item, "S", side);
            if (r != Result::Ok) return r;
            r = helper::parse_uint64_required(item, "T", ts);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "p", trade.price);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "v", trade.qty);
            if (r != Result::Ok) return r;
            if (!market::parse_side(side, trade.side)) {
                return Result::InvalidValue;
            }
            trade.id = std::string(id);
            trade.symbol = std::string(symbol);
            trade.is_buyer_maker = (trade.side == market::Side::Sell);
            trade.timestamp = from_epoch_ms(static_cast<std::int64_t>(ts));
            trades.push_back(std::move(trade));
        }
        out.kind = MessageKind::Trades;
        out.topic = std::string(topic);
        out.payload = std::move(trades);
        return Result::Ok;
    }

    // {"topic":"kline.5.BTCUSDT","type":"snapshot","ts":1672324988882,
    //  "data":[{"start":1672324800000,"end":1672325099999,"interval":"5","open":"16649.5",
    //           "close":"16677","high":"16677","low":"16608","volume":"2.081","turnover":"34666.4005",
    //           "confirm":false,"timestamp":1672324988882}]}
    [[nodiscard]]
    static Result decode_klines_(const simdjson::dom::element& root, std::string_view topic, Message& out) noexcept {
        const auto dot = topic.rfind('.');
        if (dot == std::string_view::npos || dot + 1 >= topic.size()) {
            return Result::InvalidValue;
        }
        const std::string_view symbol = topic.substr(dot + 1);

        simdjson::dom::array data;
        if (helper::parse_array_required(root, "data", data) != Result::Ok) {
            return Result::InvalidSchema;
        }
        std::vector<market::Kline> klines;
        klines.reserve(data.size());
        for (auto item : data) {
            if (helper::require_object(item) != Result::Ok) {
                return Result::InvalidSchema;
            }
            market::Kline k;
            std::string_view interval;
            std::uint64_t start = 0;
            std::uint64_t end = 0;
            bool confirm = false;
            auto r = helper::parse_string_required(item, "interval", interval);
            if (r != Result::Ok) return r;
            r = helper::parse_uint64_required(item, "start", start);
            if (r != Result::Ok) return r;
            r = helper::parse_uint64_required(item, "end", end);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "open", k.open);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "high", k.high);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "low", k.low);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "close", k.close);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_required(item, "volume", k.volume);
            if (r != Result::Ok) return r;
            r = helper::parse_decimal_optional(item, "turnover", k.quote_volume);
            if (r != Result::Ok) return r;
            r = helper::parse_bool_required(item, "confirm", confirm);
            if (r != Result::Ok) return r;
            if (!parse_interval_token(interval, k.interval)) {
                return Result::InvalidValue;
            }
            k.symbol = std::string(symbol);
            k.open_time = from_epoch_ms(static_cast<std::int64_t>(start));
            k.close_time = from_epoch_ms(static_cast<std::int64_t>(end));
            k.is_closed = confirm;
            klines.push_back(std::move(k));
        }
        out.kind = MessageKind::Klines;
        out.topic = std::string(topic);
        out.payload = std::move(klines);
        return Result::Ok;
    }

private:
    simdjson::dom::parser parser_;
};

static_assert(CodecConcept<Codec>);

} // namespace tidewire::core::protocol::bybit
