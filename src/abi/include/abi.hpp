#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "parser.hpp"

namespace lens::abi
{
    struct ParameterDefinition
    {
        std::string name;
        std::string type;
        bool indexed = false;
    };

    struct EventDefinition
    {
        std::string name;

        // declaration order, indexed and non-indexed interleaved
        std::vector<ParameterDefinition> inputs;
    };

    /**
     * @brief Builds the canonical signature `name(type1,type2,...)` over every input.
     * 
     * @param event The event definition.
     * @return The signature text, the preimage of topic 0.
     */
    std::string constructSignature(const EventDefinition & event);

    /**
     * @brief Extracts the event definitions of a JSON ABI.
     * 
     * Entries whose "type" is not "event" are skipped, ABI order is preserved.
     * 
     * @param abi_text The ABI as JSON text.
     * @return The event definitions, or an error when the text is not a list of definitions.
     */
    parse::Result<std::vector<EventDefinition>> parseAbi(std::string_view abi_text);
}

namespace lens::parse
{
    template<>
    Result<abi::ParameterDefinition> parseFromJson(json json_obj, use_json_t);

    template<>
    Result<abi::EventDefinition> parseFromJson(json json_obj, use_json_t);
}
