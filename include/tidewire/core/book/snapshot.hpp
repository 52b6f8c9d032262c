#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <iosfwd>

#include "tidewire/core/book/level.hpp"
#include "tidewire/core/market/symbol.hpp"
#include "tidewire/core/timestamp.hpp"

namespace tidewire::core::book {

// -----------------------------------------------------------------------------
// Immutable view of a replica at one watermark.
//
// bids are sorted by price descending, asks ascending, no duplicate prices and
// no zero quantities. Instances are only ever handed out as SnapshotPtr and are
// never mutated after publication.
// -----------------------------------------------------------------------------
struct Snapshot {
    market::Symbol symbol;
    Levels         bids;
    Levels         asks;
    std::uint64_t  last_update_id{0};
    std::uint64_t  sequence{0};
    Timestamp      timestamp{};

    // nullptr when the side is empty
    [[nodiscard]] const Level* best_bid() const noexcept;
    [[nodiscard]] const Level* best_ask() const noexcept;

    // false when either side is empty
    [[nodiscard]] bool spread(double& out) const noexcept;
    [[nodiscard]] bool mid_price(double& out) const noexcept;

    [[nodiscard]] std::size_t bid_depth() const noexcept { return bids.size(); }
    [[nodiscard]] std::size_t ask_depth() const noexcept { return asks.size(); }
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

std::ostream& operator<<(std::ostream& os, const Snapshot& s);

} // namespace tidewire::core::book
