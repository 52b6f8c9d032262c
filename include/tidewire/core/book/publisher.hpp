#pragma once

#include <atomic>
#include <memory>

#include "tidewire/core/book/snapshot.hpp"

namespace tidewire::core::book {

// -----------------------------------------------------------------------------
// Single-writer / many-reader slot holding the latest published snapshot.
//
// The writer swaps in a fully built SnapshotPtr; readers get their own
// reference and can keep it as long as they like. Nothing is locked and no
// reader ever sees a partially applied update.
// -----------------------------------------------------------------------------
class Publisher {
public:
    Publisher() = default;

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    inline void publish(SnapshotPtr snap) noexcept {
        current_.store(std::move(snap), std::memory_order_release);
    }

    inline void reset() noexcept {
        current_.store(SnapshotPtr{}, std::memory_order_release);
    }

    [[nodiscard]]
    inline SnapshotPtr load() const noexcept {
        return current_.load(std::memory_order_acquire);
    }

private:
    std::atomic<SnapshotPtr> current_;
};

} // namespace tidewire::core::book
