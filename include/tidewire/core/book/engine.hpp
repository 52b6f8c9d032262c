#pragma once

#include <deque>
#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "tidewire/core/book/update.hpp"
#include "tidewire/core/book/replica.hpp"
#include "tidewire/core/book/snapshot.hpp"
#include "tidewire/core/telemetry.hpp"
#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::book {

// ===============================================
// OUTCOME OF FEEDING ONE MESSAGE
// ===============================================
enum class Outcome : std::uint8_t {
    Applied,    // new snapshot published
    Stale,      // dropped, already covered by the watermark
    Buffered,   // held until a snapshot arrives
    Gap,        // replica invalidated, buffer discarded
    Invalid     // malformed, dropped without side effects
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Applied:  return "Applied";
        case Outcome::Stale:    return "Stale";
        case Outcome::Buffered: return "Buffered";
        case Outcome::Gap:      return "Gap";
        case Outcome::Invalid:  return "Invalid";
        default:                return "Unknown";
    }
}

namespace telemetry {

struct Engine {
    lcr::metrics::atomic::counter64 snapshots_applied_total;
    lcr::metrics::atomic::counter64 diffs_applied_total;
    lcr::metrics::atomic::counter64 diffs_stale_total;
    lcr::metrics::atomic::counter64 diffs_buffered_total;
    lcr::metrics::atomic::counter64 buffer_overflow_total;
    lcr::metrics::atomic::counter64 gaps_total;
    lcr::metrics::atomic::counter64 invalid_total;
};

} // namespace telemetry

/*
===============================================================================
 book::Engine
===============================================================================

Order-book consistency engine. Owns one replica per book topic (a topic
identifies symbol and depth) and implements the snapshot + diff protocol:

  - Diffs received before the first snapshot (or after an invalidation) are
    buffered, bounded by max_buffered_diffs (oldest evicted first).
  - A snapshot resets the replica, then buffered diffs are replayed in
    arrival order. Stale ones are skipped; a gap during replay invalidates
    the replica again.
  - A gap on a live replica invalidates it and discards the buffer. The
    caller decides how to resynchronize (new snapshot or reconnect).
  - After every applied snapshot or diff a new immutable Snapshot is built;
    latest() returns it. Nothing partial is ever published.

Replicas are created lazily on the first message for a topic and destroyed by
erase() when the last subscriber of that book leaves.

Single-threaded: called only from the stream engine driver.
===============================================================================
*/
class Engine {
public:
    explicit Engine(std::size_t max_buffered_diffs) noexcept
        : max_buffered_(max_buffered_diffs == 0 ? 1 : max_buffered_diffs)
    {}

    [[nodiscard]]
    inline Outcome on_snapshot(const std::string& topic, const Update& snap) {
        auto& b = book_(topic, snap.symbol);
        if (b.replica.apply_snapshot(snap) != ApplyResult::Applied) {
            TW_TL1( telemetry_.invalid_total.inc() );
            return Outcome::Invalid;
        }
        TW_TL1( telemetry_.snapshots_applied_total.inc() );
        // Replay diffs that arrived ahead of the snapshot
        while (!b.pending.empty()) {
            Update diff = std::move(b.pending.front());
            b.pending.pop_front();
            switch (b.replica.apply_diff(diff)) {
                case ApplyResult::Applied:
                    TW_TL1( telemetry_.diffs_applied_total.inc() );
                    break;
                case ApplyResult::Stale:
                    TW_TL1( telemetry_.diffs_stale_total.inc() );
                    break;
                case ApplyResult::Gap:
                    TW_WARN("[BOOK:" << topic << "] Gap while replaying buffered diffs (u=" << b.replica.last_update_id()
                            << ", first=" << diff.first_update_id << ")");
                    invalidate_(b);
                    TW_TL1( telemetry_.gaps_total.inc() );
                    return Outcome::Gap;
                default:
                    break;
            }
        }
        b.latest = b.replica.make_snapshot();
        return Outcome::Applied;
    }

    [[nodiscard]]
    inline Outcome on_diff(const std::string& topic, const Update& diff) {
        if (!is_valid_update(diff)) {
            TW_WARN("[BOOK:" << topic << "] Rejecting malformed diff [" << diff.first_update_id << ", " << diff.final_update_id << "]");
            TW_TL1( telemetry_.invalid_total.inc() );
            return Outcome::Invalid;
        }
        auto& b = book_(topic, diff.symbol);
        if (!b.replica.valid()) {
            if (b.pending.size() >= max_buffered_) {
                b.pending.pop_front();
                TW_TL1( telemetry_.buffer_overflow_total.inc() );
            }
            b.pending.push_back(diff);
            TW_TL1( telemetry_.diffs_buffered_total.inc() );
            return Outcome::Buffered;
        }
        switch (b.replica.apply_diff(diff)) {
            case ApplyResult::Applied:
                TW_TL1( telemetry_.diffs_applied_total.inc() );
                b.latest = b.replica.make_snapshot();
                return Outcome::Applied;
            case ApplyResult::Stale:
                TW_TL1( telemetry_.diffs_stale_total.inc() );
                return Outcome::Stale;
            case ApplyResult::Gap:
                TW_WARN("[BOOK:" << topic << "] Sequence gap (u=" << b.replica.last_update_id()
                        << ", first=" << diff.first_update_id << ", final=" << diff.final_update_id << ")");
                invalidate_(b);
                TW_TL1( telemetry_.gaps_total.inc() );
                return Outcome::Gap;
            default:
                TW_TL1( telemetry_.invalid_total.inc() );
                return Outcome::Invalid;
        }
    }

    // Connection loss: updates may have been missed, rebuild from a snapshot
    inline void invalidate(const std::string& topic) noexcept {
        auto it = books_.find(topic);
        if (it != books_.end()) {
            invalidate_(it->second);
        }
    }

    inline void erase(const std::string& topic) noexcept {
        if (books_.erase(topic) > 0) {
            TW_DEBUG("[BOOK:" << topic << "] Replica destroyed");
        }
    }

    // Accessors
    [[nodiscard]]
    inline bool contains(const std::string& topic) const noexcept {
        return books_.find(topic) != books_.end();
    }

    [[nodiscard]]
    inline bool is_valid(const std::string& topic) const noexcept {
        auto it = books_.find(topic);
        return it != books_.end() && it->second.replica.valid();
    }

    // Latest published snapshot, null while invalid
    [[nodiscard]]
    inline SnapshotPtr latest(const std::string& topic) const noexcept {
        auto it = books_.find(topic);
        return it == books_.end() ? SnapshotPtr{} : it->second.latest;
    }

    [[nodiscard]]
    inline std::size_t buffered(const std::string& topic) const noexcept {
        auto it = books_.find(topic);
        return it == books_.end() ? 0 : it->second.pending.size();
    }

    [[nodiscard]]
    inline const Replica* replica(const std::string& topic) const noexcept {
        auto it = books_.find(topic);
        return it == books_.end() ? nullptr : &it->second.replica;
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return books_.size();
    }

    [[nodiscard]]
    inline const telemetry::Engine& metrics() const noexcept {
        return telemetry_;
    }

private:
    struct Book {
        explicit Book(const std::string& symbol)
            : replica(symbol)
        {}

        Replica replica;
        std::deque<Update> pending;
        SnapshotPtr latest;
    };

    inline Book& book_(const std::string& topic, const std::string& symbol) {
        auto it = books_.find(topic);
        if (it == books_.end()) {
            TW_DEBUG("[BOOK:" << topic << "] Replica created");
            it = books_.try_emplace(topic, symbol).first;
        }
        return it->second;
    }

    inline void invalidate_(Book& b) noexcept {
        b.replica.invalidate();
        b.pending.clear();
        b.latest.reset();
    }

private:
    std::size_t max_buffered_;
    std::unordered_map<std::string, Book> books_;
    telemetry::Engine telemetry_;
};

} // namespace tidewire::core::book
