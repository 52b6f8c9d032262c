#pragma once

#include <string>
#include <string_view>
#include <cstdlib>

#include "tidewire/core/transport/error.hpp"


namespace tidewire::core::transport {

struct ParsedUrl {
    bool secure{false};     // wss
    std::string host;
    std::string port;
    std::string path;
};

// ---------------------------------------------------------------------
// Minimal ws:// / wss:// URL parser.
//
// Accepts scheme://host[:port][/path[?query]]. Default ports are 80 (ws)
// and 443 (wss), default path is "/". Anything else (other schemes,
// userinfo, empty host, non-numeric or out-of-range port) is rejected.
//
// Examples:
//   wss://stream.bybit.com/v5/public/spot
//   ws://localhost:9001
// ---------------------------------------------------------------------
[[nodiscard]]
inline Error parse_url(std::string_view url, ParsedUrl& out) {
    out = ParsedUrl{};
    constexpr std::string_view ws  = "ws://";
    constexpr std::string_view wss = "wss://";

    std::size_t pos = 0;
    if (url.substr(0, wss.size()) == wss) {
        out.secure = true;
        pos = wss.size();
    }
    else if (url.substr(0, ws.size()) == ws) {
        out.secure = false;
        pos = ws.size();
    }
    else {
        return Error::InvalidUrl;
    }

    const std::size_t slash = url.find('/', pos);
    const std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
    if (hostport.empty() || hostport.find('@') != std::string_view::npos) {
        return Error::InvalidUrl;
    }

    const std::size_t colon = hostport.rfind(':');
    if (colon != std::string_view::npos) {
        out.host = std::string(hostport.substr(0, colon));
        out.port = std::string(hostport.substr(colon + 1));
    }
    else {
        out.host = std::string(hostport);
        out.port = out.secure ? "443" : "80";
    }
    out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(url.substr(slash));

    if (out.host.empty() || out.port.empty() || out.port.size() > 5) {
        return Error::InvalidUrl;
    }
    for (char c : out.port) {
        if (c < '0' || c > '9') {
            return Error::InvalidUrl;
        }
    }
    const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
    if (p == 0 || p > 65535) {
        return Error::InvalidUrl;
    }
    return Error::None;
}

} // namespace tidewire::core::transport
