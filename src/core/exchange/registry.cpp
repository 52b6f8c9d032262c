#include "tidewire/core/exchange/registry.hpp"
#include "tidewire/core/transport/parse_url.hpp"
#include "lcr/log/logger.hpp"


namespace tidewire::core::exchange {

bool has_valid_endpoints(const Descriptor& d) {
    transport::ParsedUrl url;
    return transport::parse_url(d.market_endpoint, url) == transport::Error::None &&
           transport::parse_url(d.depth_endpoint, url) == transport::Error::None;
}

Error Registry::add(const Descriptor& descriptor) {
    if (!is_valid(descriptor.provider)) {
        TW_WARN("[REGISTRY] Rejecting descriptor with invalid provider");
        return Error::InvalidProvider;
    }
    if (!has_valid_endpoints(descriptor)) {
        TW_WARN("[REGISTRY] Rejecting " << descriptor.provider << ": invalid endpoint");
        return Error::InvalidEndpoint;
    }
    const auto [it, inserted] = entries_.emplace(descriptor.provider, descriptor);
    if (!inserted) {
        TW_WARN("[REGISTRY] Provider already registered: " << descriptor.provider);
        return Error::DuplicateProvider;
    }
    TW_DEBUG("[REGISTRY] Registered " << it->first);
    return Error::None;
}

bool Registry::contains(Provider p) const noexcept {
    return entries_.find(p) != entries_.end();
}

const Descriptor* Registry::find(Provider p) const noexcept {
    auto it = entries_.find(p);
    return (it == entries_.end()) ? nullptr : &it->second;
}

std::vector<Provider> Registry::providers() const {
    std::vector<Provider> out;
    out.reserve(entries_.size());
    for (const auto& [p, _] : entries_) {
        out.push_back(p);
    }
    return out;
}

} // namespace tidewire::core::exchange
