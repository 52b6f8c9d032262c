#pragma once

#include <cstdint>
#include <string>

#include "tidewire/core/book/level.hpp"
#include "tidewire/core/timestamp.hpp"

namespace tidewire::core::book {

// -----------------------------------------------------------------------------
// Decoded order-book payload, used for both snapshots and diffs.
//
// Snapshot: first_update_id == final_update_id == the snapshot watermark.
// Diff:     covers the update-id range [first_update_id, final_update_id].
// -----------------------------------------------------------------------------
struct Update {
    std::string   symbol;
    Levels        bids;
    Levels        asks;
    std::uint64_t first_update_id{0};
    std::uint64_t final_update_id{0};
    std::uint64_t exchange_seq{0};      // exchange cross sequence, informational
    Timestamp     timestamp{};
};

[[nodiscard]]
inline bool is_valid_update(const Update& u) noexcept {
    if (u.final_update_id < u.first_update_id) {
        return false;
    }
    for (const auto& l : u.bids) {
        if (!is_valid_level(l)) return false;
    }
    for (const auto& l : u.asks) {
        if (!is_valid_level(l)) return false;
    }
    return true;
}

} // namespace tidewire::core::book
