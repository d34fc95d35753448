#pragma once

#include <optional>
#include <string_view>

#include "abi.hpp"
#include "assembler.hpp"
#include "data.hpp"
#include "error.hpp"
#include "log_record.hpp"
#include "matcher.hpp"
#include "parameter_store.hpp"
#include "slot.hpp"
#include "topics.hpp"

namespace lens::decoder
{
    /**
     * @brief Decodes one log against an ABI.
     * 
     * The ABI is parsed on every call. A malformed ABI and a log that matches
     * no event both yield std::nullopt; they are not errors.
     * 
     * @param record The log to decode.
     * @param abi_text The ABI as JSON text.
     * @return The decoded event, std::nullopt when nothing matched,
     * or OUT_OF_BOUNDS / MALFORMED_INPUT when the matched event does not fit the log.
     */
    Result<std::optional<DecodedEvent>> decodeLog(const LogRecord & record, std::string_view abi_text);

    /**
     * @brief Decodes a raw log object against the ABI held in the parameter store.
     * 
     * @param input The log as received from the host.
     * @param parameters The parameter store.
     * @return The input enriched with hash, block, signature and arguments; the input unchanged
     * when no event matched or the ABI is malformed; NOT_CONFIGURED when the store is empty.
     */
    Result<json> transformLog(json input, const config::ParameterStore & parameters);
}
