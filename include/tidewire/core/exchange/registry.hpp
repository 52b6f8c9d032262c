#pragma once

#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

#include "tidewire/core/exchange/descriptor.hpp"
#include "tidewire/core/exchange/provider.hpp"

namespace tidewire::core::exchange {

enum class Error : std::uint8_t {
    None = 0,
    DuplicateProvider,  // provider already registered
    InvalidProvider,    // provider value out of range
    InvalidEndpoint     // endpoint URL does not parse
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:              return "None";
        case Error::DuplicateProvider: return "DuplicateProvider";
        case Error::InvalidProvider:   return "InvalidProvider";
        case Error::InvalidEndpoint:   return "InvalidEndpoint";
        default:                       return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Caller-owned table of exchange descriptors, one per provider.
// Not thread-safe; populate it before handing descriptors to engines.
// -----------------------------------------------------------------------------
class Registry {
public:
    [[nodiscard]]
    Error add(const Descriptor& descriptor);

    [[nodiscard]]
    bool contains(Provider p) const noexcept;

    // nullptr when the provider is not registered
    [[nodiscard]]
    const Descriptor* find(Provider p) const noexcept;

    // Registered providers in enum order
    [[nodiscard]]
    std::vector<Provider> providers() const;

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return entries_.size();
    }

private:
    std::map<Provider, Descriptor> entries_;
};

} // namespace tidewire::core::exchange
