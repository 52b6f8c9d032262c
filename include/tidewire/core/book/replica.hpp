#pragma once

#include <map>
#include <memory>
#include <string>
#include <cstdint>
#include <functional>
#include <string_view>

#include "tidewire/core/book/level.hpp"
#include "tidewire/core/book/update.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::book {

// ===============================================
// APPLY RESULT
// ===============================================
enum class ApplyResult : std::uint8_t {
    Applied,    // replica mutated, watermark advanced
    Stale,      // final_update_id <= watermark, replica untouched
    Gap,        // first_update_id > watermark + 1, replica untouched
    Invalid,    // malformed payload, replica untouched
    NotReady    // no snapshot applied yet (or invalidated)
};

[[nodiscard]]
inline constexpr std::string_view to_string(ApplyResult r) noexcept {
    switch (r) {
        case ApplyResult::Applied:  return "Applied";
        case ApplyResult::Stale:    return "Stale";
        case ApplyResult::Gap:      return "Gap";
        case ApplyResult::Invalid:  return "Invalid";
        case ApplyResult::NotReady: return "NotReady";
        default:                    return "Unknown";
    }
}

/*
===============================================================================
 book::Replica
===============================================================================

Authoritative local copy of one order book (one symbol at one depth).

Invariants (hold after every public call):
  - bids strictly descending by price, asks strictly ascending
  - no duplicate price levels
  - no level with quantity zero is stored
  - last_update_id() only moves forward while valid
  - sequence() increments once per applied snapshot or diff, never resets

Mutation is all-or-nothing: an update is fully validated and classified
before any level is touched, so a rejected update leaves the replica exactly
as it was.

Diff rule (watermark W = last_update_id()):
  final <= W                 -> Stale (idempotent replay)
  first >  W + 1             -> Gap
  first <= W + 1 <= final    -> Applied

The replica never invalidates itself: gap handling is the caller's decision.
===============================================================================
*/
class Replica {
public:
    explicit Replica(std::string symbol)
        : symbol_(std::move(symbol))
    {}

    // Replaces the whole book with the snapshot content
    [[nodiscard]]
    inline ApplyResult apply_snapshot(const Update& snap) {
        if (!is_valid_update(snap)) {
            TW_WARN("[BOOK:" << symbol_ << "] Rejecting malformed snapshot (u=" << snap.final_update_id << ")");
            return ApplyResult::Invalid;
        }
        bids_.clear();
        asks_.clear();
        for (const auto& l : snap.bids) {
            set_level_(bids_, l);
        }
        for (const auto& l : snap.asks) {
            set_level_(asks_, l);
        }
        last_update_id_ = snap.final_update_id;
        timestamp_ = snap.timestamp;
        valid_ = true;
        ++sequence_;
        TW_DEBUG("[BOOK:" << symbol_ << "] Snapshot applied (u=" << last_update_id_ << ", bids=" << bids_.size() << ", asks=" << asks_.size() << ")");
        return ApplyResult::Applied;
    }

    [[nodiscard]]
    inline ApplyResult apply_diff(const Update& diff) {
        const ApplyResult r = classify(diff);
        if (r != ApplyResult::Applied) {
            return r;
        }
        for (const auto& l : diff.bids) {
            set_level_(bids_, l);
        }
        for (const auto& l : diff.asks) {
            set_level_(asks_, l);
        }
        last_update_id_ = diff.final_update_id;
        timestamp_ = diff.timestamp;
        ++sequence_;
        return ApplyResult::Applied;
    }

    // What apply_diff() would do, without mutating
    [[nodiscard]]
    inline ApplyResult classify(const Update& diff) const noexcept {
        if (!valid_) {
            return ApplyResult::NotReady;
        }
        if (!is_valid_update(diff)) {
            return ApplyResult::Invalid;
        }
        if (diff.final_update_id <= last_update_id_) {
            return ApplyResult::Stale;
        }
        if (diff.first_update_id > last_update_id_ + 1) {
            return ApplyResult::Gap;
        }
        return ApplyResult::Applied;
    }

    // Drops all levels; the next snapshot rebuilds the replica
    inline void invalidate() noexcept {
        TW_DEBUG("[BOOK:" << symbol_ << "] Replica invalidated (u=" << last_update_id_ << ")");
        bids_.clear();
        asks_.clear();
        valid_ = false;
    }

    // Builds the immutable view published to readers
    [[nodiscard]]
    inline SnapshotPtr make_snapshot() const {
        auto snap = std::make_shared<Snapshot>();
        snap->symbol = symbol_;
        snap->bids.reserve(bids_.size());
        for (const auto& [price, qty] : bids_) {
            snap->bids.push_back(Level{price, qty});
        }
        snap->asks.reserve(asks_.size());
        for (const auto& [price, qty] : asks_) {
            snap->asks.push_back(Level{price, qty});
        }
        snap->last_update_id = last_update_id_;
        snap->sequence = sequence_;
        snap->timestamp = timestamp_;
        return snap;
    }

    // Accessors
    [[nodiscard]] inline bool valid() const noexcept { return valid_; }
    [[nodiscard]] inline const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] inline std::uint64_t last_update_id() const noexcept { return last_update_id_; }
    [[nodiscard]] inline std::uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] inline std::size_t bid_levels() const noexcept { return bids_.size(); }
    [[nodiscard]] inline std::size_t ask_levels() const noexcept { return asks_.size(); }

    // Full invariant check (O(n)); used by tests and debug assertions
    [[nodiscard]]
    inline bool check_invariants() const noexcept {
        const double* prev = nullptr;
        for (const auto& [price, qty] : bids_) {
            if (qty <= 0.0 || (prev && !(price < *prev))) return false;
            prev = &price;
        }
        prev = nullptr;
        for (const auto& [price, qty] : asks_) {
            if (qty <= 0.0 || (prev && !(price > *prev))) return false;
            prev = &price;
        }
        return true;
    }

private:
    template<typename Side>
    static inline void set_level_(Side& side, const Level& l) {
        if (l.qty == 0.0) {
            side.erase(l.price);
        }
        else {
            side.insert_or_assign(l.price, l.qty);
        }
    }

private:
    std::string symbol_;
    std::map<double, double, std::greater<double>> bids_;
    std::map<double, double, std::less<double>> asks_;
    std::uint64_t last_update_id_{0};
    std::uint64_t sequence_{0};
    Timestamp timestamp_{};
    bool valid_{false};
};

} // namespace tidewire::core::book
