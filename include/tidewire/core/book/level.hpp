#pragma once

#include <cmath>
#include <vector>
#include <ostream>

namespace tidewire::core::book {

// One price level. In a diff, qty == 0 removes the level.
struct Level {
    double price{0.0};
    double qty{0.0};

    [[nodiscard]]
    inline double value() const noexcept {
        return price * qty;
    }

    [[nodiscard]]
    inline bool operator==(const Level& other) const noexcept = default;
};

using Levels = std::vector<Level>;

// Structural validity of a level received from the wire
[[nodiscard]]
inline bool is_valid_level(const Level& l) noexcept {
    return std::isfinite(l.price) && std::isfinite(l.qty) && l.price > 0.0 && l.qty >= 0.0;
}

inline std::ostream& operator<<(std::ostream& os, const Level& l) {
    return os << "(" << l.price << ", " << l.qty << ")";
}

} // namespace tidewire::core::book
