#include "data.hpp"

#include <format>

#include <evmc/hex.hpp>

#include "slot.hpp"
#include "word.hpp"

namespace lens::decoder
{
    Result<std::vector<DecodedArgument>> decodeData(const abi::EventDefinition & event, std::string_view data_hex)
    {
        std::vector<const abi::ParameterDefinition *> data_inputs;
        for(const abi::ParameterDefinition & input : event.inputs)
        {
            if(!input.indexed)
            {
                data_inputs.push_back(&input);
            }
        }

        const auto bytes_res = evmc::from_hex(data_hex);
        if(!bytes_res)
        {
            return std::unexpected(Error{Error::Kind::MALFORMED_INPUT, "data is not valid hex"});
        }

        const auto & bytes = *bytes_res;
        const std::size_t required_size = data_inputs.size() * chain::WORD_SIZE;
        if(bytes.size() < required_size)
        {
            return std::unexpected(Error{Error::Kind::OUT_OF_BOUNDS,
                std::format("{} expects {} data bytes, log has {}", event.name, required_size, bytes.size())});
        }

        std::vector<DecodedArgument> arguments;
        arguments.reserve(data_inputs.size());

        std::size_t offset = 0;
        for(const abi::ParameterDefinition * input : data_inputs)
        {
            const auto slot = chain::readWord(bytes.data(), bytes.size(), offset);
            if(!slot)
            {
                return std::unexpected(Error{Error::Kind::OUT_OF_BOUNDS, std::format("no data slot at offset {}", offset)});
            }

            arguments.emplace_back(DecodedArgument{
                .name = input->name,
                .type = input->type,
                .value = decodeSlot(input->type, *slot)
            });
            offset += chain::WORD_SIZE;
        }

        return arguments;
    }
}
