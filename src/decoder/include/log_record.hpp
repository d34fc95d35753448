#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "parser.hpp"

namespace lens::decoder
{
    struct LogRecord
    {
        std::string transaction_hash;
        std::uint64_t block_number = 0;

        // topics[0] is the signature hash, the rest hold indexed values
        std::vector<std::string> topics;

        // hex, with or without 0x
        std::string data;
    };

    using ArgumentValue = std::variant<std::string, bool>;

    struct DecodedArgument
    {
        std::string name;
        std::string type;
        ArgumentValue value;
    };

    struct DecodedEvent
    {
        std::string hash;
        std::string block;
        std::string signature;

        // topic arguments first, then data arguments
        std::vector<DecodedArgument> arguments;
    };
}

namespace lens::parse
{
    /**
     * @brief Reads the log fields out of an eth_getLogs style object.
     * 
     * "topics" is required. "transactionHash", "blockNumber" and "data" default to empty / zero when absent,
     * but must have the right type when present. "blockNumber" accepts an integer or a hex quantity string.
     */
    template<>
    Result<decoder::LogRecord> parseFromJson(json json_obj, use_json_t);

    template<>
    Result<json> parseToJson(decoder::DecodedArgument argument, use_json_t);
}
