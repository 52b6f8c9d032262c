#pragma once

#include <cstdint>
#include <string_view>


namespace tidewire::core::protocol {

// ===============================================
// DECODE RESULT
// ===============================================
enum class Result : std::uint8_t {
    Ok            = 0,      // helper succeeded / message decoded
    Ignored       = 1,      // well formed but not relevant (unknown topic, server info, ...)
    InvalidJson   = 2,      // structural failure
    InvalidSchema = 3,      // missing required field, type mismatch
    InvalidValue  = 4       // field present but semantically invalid
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "unknown";
    }
}

// A decode failure is reported to subscribers, an Ignored message is not
[[nodiscard]]
inline constexpr bool is_failure(Result r) noexcept {
    return r == Result::InvalidJson || r == Result::InvalidSchema || r == Result::InvalidValue;
}

} // namespace tidewire::core::protocol
