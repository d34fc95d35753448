#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "abi.hpp"

namespace lens::decoder
{
    struct EventMatch
    {
        const abi::EventDefinition * definition = nullptr;
        std::string signature;
    };

    /**
     * @brief Finds the event whose signature hash equals topic 0.
     * 
     * Candidates are tried in ABI order and the first hit wins. The comparison is on
     * the text: topic 0 must be the lowercase hex digest with its 0x prefix.
     * The returned match points into `events`, which must outlive it.
     * 
     * @param topic0 The leading topic of the log.
     * @param events Candidate definitions.
     */
    std::optional<EventMatch> matchEvent(std::string_view topic0, const std::vector<abi::EventDefinition> & events);
}
