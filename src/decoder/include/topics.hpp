#pragma once

#include <string>
#include <vector>

#include "abi.hpp"
#include "error.hpp"
#include "log_record.hpp"

namespace lens::decoder
{
    /**
     * @brief Decodes the indexed inputs of a matched event from topics[1..].
     * 
     * The input at position i of the declaration, indexed or not, owns topic i + 1;
     * only indexed inputs read theirs. A topic the last indexed input needs but the
     * log lacks is OUT_OF_BOUNDS, topics past it are MALFORMED_INPUT.
     * 
     * @param event The matched definition.
     * @param topics All topics of the log, the signature topic included.
     * @return One argument per indexed input, in declaration order.
     */
    Result<std::vector<DecodedArgument>> decodeTopics(const abi::EventDefinition & event, const std::vector<std::string> & topics);
}
