#include "topics.hpp"

#include <format>

#include "crypto.hpp"
#include "slot.hpp"

namespace lens::decoder
{
    namespace
    {
        // topic slots follow the overall parameter position: inputs[i] lives in topics[1 + i]
        std::size_t _requiredTopicCount(const abi::EventDefinition & event)
        {
            std::size_t required = 1;
            for(std::size_t i = 0; i < event.inputs.size(); ++i)
            {
                if(event.inputs[i].indexed)
                {
                    required = 2 + i;
                }
            }
            return required;
        }

        const std::string * _topicAt(const std::vector<std::string> & topics, std::size_t index)
        {
            if(index >= topics.size())
            {
                return nullptr;
            }
            return &topics[index];
        }
    }

    Result<std::vector<DecodedArgument>> decodeTopics(const abi::EventDefinition & event, const std::vector<std::string> & topics)
    {
        const std::size_t required_count = _requiredTopicCount(event);

        if(topics.size() > required_count)
        {
            return std::unexpected(Error{Error::Kind::MALFORMED_INPUT,
                std::format("{} uses {} topics, log has {}", event.name, required_count, topics.size())});
        }

        std::vector<DecodedArgument> arguments;

        for(std::size_t i = 0; i < event.inputs.size(); ++i)
        {
            const abi::ParameterDefinition & input = event.inputs[i];
            if(!input.indexed)
            {
                continue;
            }

            const std::size_t topic_index = 1 + i;
            const std::string * topic = _topicAt(topics, topic_index);
            if(topic == nullptr)
            {
                return std::unexpected(Error{Error::Kind::OUT_OF_BOUNDS,
                    std::format("{} reads {} from topic {}, log has {} topics", event.name, input.name, topic_index, topics.size())});
            }

            const auto topic_word = crypto::decodeTopicWord(*topic);
            if(!topic_word)
            {
                return std::unexpected(Error{Error::Kind::MALFORMED_INPUT,
                    std::format("topic {} is not a 32-byte hex word", topic_index)});
            }

            arguments.emplace_back(DecodedArgument{
                .name = input.name,
                .type = input.type,
                .value = decodeSlot(input.type, *topic_word)
            });
        }

        return arguments;
    }
}
