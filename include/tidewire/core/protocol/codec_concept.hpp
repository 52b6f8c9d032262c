/*
===============================================================================
 CodecConcept
===============================================================================

Exchange wire format contract consumed by the stream engine.

A codec
  - maps a logical Topic to the exchange's wire topic (empty when the exchange
    cannot express it)
  - builds subscribe / unsubscribe / ping control messages
  - decodes one raw inbound message into a normalized protocol::Message

decode() never throws and never logs; the engine decides how a failed or
ignored message is reported.
===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <concepts>

#include "tidewire/core/protocol/topic.hpp"
#include "tidewire/core/protocol/message.hpp"
#include "tidewire/core/protocol/result.hpp"


namespace tidewire::core::protocol {

template<class C>
concept CodecConcept =
    std::default_initializable<C> &&
    requires(
        C codec,
        const C ccodec,
        std::string_view raw,
        Message& out,
        const Topic& topic,
        const std::vector<std::string>& topics
    )
{
    { codec.decode(raw, out) } -> std::same_as<Result>;

    { ccodec.topic_name(topic) } -> std::same_as<std::string>;
    { ccodec.subscribe_request(topics) } -> std::same_as<std::string>;
    { ccodec.unsubscribe_request(topics) } -> std::same_as<std::string>;
    { ccodec.ping_request() } -> std::same_as<std::string>;
};

} // namespace tidewire::core::protocol
