#pragma once

#include <string_view>
#include <vector>

#include "abi.hpp"
#include "error.hpp"
#include "log_record.hpp"

namespace lens::decoder
{
    /**
     * @brief Decodes the non-indexed inputs of a matched event from the data blob.
     * 
     * The k-th non-indexed input reads the 32-byte slot at offset 32 * k.
     * Bytes past the last slot are ignored.
     * 
     * @param event The matched definition.
     * @param data_hex The data blob, hex with or without 0x.
     * @return One argument per non-indexed input, in declaration order.
     */
    Result<std::vector<DecodedArgument>> decodeData(const abi::EventDefinition & event, std::string_view data_hex);
}
