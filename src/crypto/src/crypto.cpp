#include "crypto.hpp"

#include <cstring>

#include <ethash/keccak.hpp>
#include <evmc/hex.hpp>

namespace lens::crypto
{
    evmc::bytes32 constructEventTopic(std::string_view signature)
    {
        const ethash::hash256 hash = ethash::keccak256(reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size());

        evmc::bytes32 topic{};
        std::memcpy(topic.bytes, hash.bytes, sizeof(topic.bytes));
        return topic;
    }

    std::string constructEventTopicHex(std::string_view signature)
    {
        return std::string("0x") + evmc::hex(constructEventTopic(signature));
    }

    std::optional<evmc::bytes32> decodeTopicWord(std::string_view topic_hex)
    {
        if(topic_hex.starts_with("0x"))
        {
            topic_hex.remove_prefix(2);
        }

        // evmc left-pads short input, a topic is always a full word
        if(topic_hex.size() != 2 * sizeof(evmc::bytes32::bytes))
        {
            return std::nullopt;
        }

        return evmc::from_hex<evmc::bytes32>(topic_hex);
    }
}
