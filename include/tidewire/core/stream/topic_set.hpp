#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>


namespace tidewire::core::stream {

// -----------------------------------------------------------------------------
// Reference-counted set of wire topics subscribed on one connection.
//
// acquire() returns true on the 0 -> 1 edge (subscribe must be sent),
// release() returns true on the 1 -> 0 edge (unsubscribe must be sent).
// -----------------------------------------------------------------------------
class TopicSet {
public:
    [[nodiscard]]
    inline bool acquire(const std::string& topic) {
        return ++refs_[topic] == 1;
    }

    [[nodiscard]]
    inline bool release(const std::string& topic) {
        auto it = refs_.find(topic);
        if (it == refs_.end()) {
            return false;
        }
        if (--it->second > 0) {
            return false;
        }
        refs_.erase(it);
        return true;
    }

    [[nodiscard]]
    inline bool contains(const std::string& topic) const noexcept {
        return refs_.find(topic) != refs_.end();
    }

    [[nodiscard]]
    inline int count(const std::string& topic) const noexcept {
        auto it = refs_.find(topic);
        return it == refs_.end() ? 0 : it->second;
    }

    [[nodiscard]]
    inline std::vector<std::string> topics() const {
        std::vector<std::string> out;
        out.reserve(refs_.size());
        for (const auto& [t, _] : refs_) {
            out.push_back(t);
        }
        return out;
    }

    inline void clear() noexcept {
        refs_.clear();
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return refs_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return refs_.empty(); }

private:
    std::unordered_map<std::string, int> refs_;
};

} // namespace tidewire::core::stream
