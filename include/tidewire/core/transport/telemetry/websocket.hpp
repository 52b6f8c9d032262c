#pragma once

#include "lcr/metrics/atomic/counter.hpp"

namespace tidewire::core::transport::telemetry {

// Shared by every transport instance created by one engine
struct WebSocket {
    lcr::metrics::atomic::counter64 connects_total;
    lcr::metrics::atomic::counter64 connect_failures_total;
    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;
    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;
    lcr::metrics::atomic::counter64 messages_dropped_total;
    lcr::metrics::atomic::counter64 close_events_total;
};

} // namespace tidewire::core::transport::telemetry
