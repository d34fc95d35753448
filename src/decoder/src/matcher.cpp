#include "matcher.hpp"

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace lens::decoder
{
    std::optional<EventMatch> matchEvent(std::string_view topic0, const std::vector<abi::EventDefinition> & events)
    {
        for(const abi::EventDefinition & event : events)
        {
            std::string signature = abi::constructSignature(event);
            if(crypto::constructEventTopicHex(signature) == topic0)
            {
                spdlog::debug("Topic {} matched event {}", topic0, signature);
                return EventMatch{
                    .definition = &event,
                    .signature = std::move(signature)
                };
            }
        }

        return std::nullopt;
    }
}
