#pragma once

#include <string>
#include <vector>

#include "error.hpp"
#include "log_record.hpp"
#include "parser.hpp"

namespace lens::decoder
{
    /**
     * @brief Collects the decoded pieces of one log.
     * 
     * Topic arguments come first and data arguments are appended after them,
     * each group in the order its decoder produced it. The list is not re-sorted
     * into declaration order.
     */
    DecodedEvent assembleEvent(const LogRecord & record,
                               std::string signature,
                               std::vector<DecodedArgument> topic_arguments,
                               std::vector<DecodedArgument> data_arguments);

    /**
     * @brief Adds hash, block, signature and arguments to the original input object.
     * 
     * Every other field of `input` is kept as is.
     */
    Result<json> mergeIntoRecord(json input, const DecodedEvent & event);
}
