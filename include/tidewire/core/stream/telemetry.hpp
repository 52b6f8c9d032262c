#pragma once

#include "lcr/metrics/atomic/counter.hpp"

namespace tidewire::core::stream::telemetry {

// Driver-level counters of one stream engine
struct Engine {
    // Subscriptions
    lcr::metrics::atomic::counter64 subscriptions_opened_total;
    lcr::metrics::atomic::counter64 subscriptions_closed_total;
    lcr::metrics::atomic::counter64 retries_total;

    // Connections
    lcr::metrics::atomic::counter64 slots_created_total;
    lcr::metrics::atomic::counter64 connections_lost_total;
    lcr::metrics::atomic::counter64 pong_timeouts_total;
    lcr::metrics::atomic::counter64 pings_sent_total;

    // Messages
    lcr::metrics::atomic::counter64 messages_decoded_total;
    lcr::metrics::atomic::counter64 decode_failures_total;
    lcr::metrics::atomic::counter64 book_messages_unrouted_total;
    lcr::metrics::atomic::counter64 rejections_total;
};

} // namespace tidewire::core::stream::telemetry
