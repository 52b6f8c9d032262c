#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "tidewire/core/protocol/result.hpp"
#include "tidewire/core/book/level.hpp"

#include "simdjson.h"

/*
================================================================================
Bybit JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Allocation-free helpers used by the Bybit codec to extract primitive values
from simdjson DOM elements.

Bybit sends prices and quantities as decimal strings ("65000.5"). Those are
converted with std::from_chars; any other representation is rejected.

Helpers never log, never throw and never interpret values semantically beyond
"is this a finite number". Optional helpers leave `out` untouched when the
field is absent.
================================================================================
*/


namespace tidewire::core::protocol::bybit::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& el) noexcept {
    return (el.type() == simdjson::dom::element_type::OBJECT) ? Result::Ok : Result::InvalidSchema;
}

[[nodiscard]]
inline bool has_field(const simdjson::dom::element& obj, const char* key) noexcept {
    return !obj[key].error();
}

// ============================================================================
// DECIMAL STRINGS
// ============================================================================

[[nodiscard]]
inline bool to_double(std::string_view s, double& out) noexcept {
    if (s.empty()) {
        return false;
    }
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) {
        return false;
    }
    out = v;
    return true;
}

// ============================================================================
// REQUIRED FIELDS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_decimal_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    std::string_view s;
    auto r = parse_string_required(obj, key, s);
    if (r != Result::Ok) {
        return r;
    }
    return to_double(s, out) ? Result::Ok : Result::InvalidValue;
}

[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& obj, const char* key, simdjson::dom::element& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

[[nodiscard]]
inline Result parse_array_required(const simdjson::dom::element& obj, const char* key, simdjson::dom::array& out) noexcept {
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Ok;
}

// ============================================================================
// OPTIONAL FIELDS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& present) noexcept {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Ok;
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, bool& out, bool& present) noexcept {
    present = false;
    auto field = obj[key];
    if (field.error()) {
        return Result::Ok;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Ok;
}

// Absent or empty strings leave `out` unchanged
[[nodiscard]]
inline Result parse_decimal_optional(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    std::string_view s;
    bool present = false;
    auto r = parse_string_optional(obj, key, s, present);
    if (r != Result::Ok) {
        return r;
    }
    if (!present || s.empty()) {
        return Result::Ok;
    }
    return to_double(s, out) ? Result::Ok : Result::InvalidValue;
}

// ============================================================================
// PRICE LEVELS
// ============================================================================

// [["price","qty"], ...] -> Levels. Values must be finite decimals.
[[nodiscard]]
inline Result parse_levels(const simdjson::dom::element& obj, const char* key, book::Levels& out) noexcept {
    simdjson::dom::array arr;
    auto r = parse_array_required(obj, key, arr);
    if (r != Result::Ok) {
        return r;
    }
    out.clear();
    out.reserve(arr.size());
    for (auto entry : arr) {
        simdjson::dom::array pair;
        if (entry.get(pair) || pair.size() < 2) {
            return Result::InvalidSchema;
        }
        std::string_view ps;
        std::string_view qs;
        if (pair.at(0).get(ps) || pair.at(1).get(qs)) {
            return Result::InvalidSchema;
        }
        book::Level level;
        if (!to_double(ps, level.price) || !to_double(qs, level.qty)) {
            return Result::InvalidValue;
        }
        out.push_back(level);
    }
    return Result::Ok;
}

} // namespace tidewire::core::protocol::bybit::helper
