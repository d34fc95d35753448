#pragma once

#include <optional>
#include <string>
#include <string_view>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace lens::crypto
{
    /**
     * @brief Keccak-256 of the signature text, the value stored in topic 0 of a non-anonymous event.
     */
    evmc::bytes32 constructEventTopic(std::string_view signature);

    /**
     * @brief Same as constructEventTopic, rendered as lowercase hex with a 0x prefix.
     */
    std::string constructEventTopicHex(std::string_view signature);

    /**
     * @brief Decodes one topic.
     * 
     * An optional lowercase 0x prefix is accepted, the rule evmc::from_hex applies
     * to the data blob; exactly 64 hex digits must follow.
     */
    std::optional<evmc::bytes32> decodeTopicWord(std::string_view topic_hex);
}
