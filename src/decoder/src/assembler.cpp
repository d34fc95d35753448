#include "assembler.hpp"

#include <format>
#include <iterator>

namespace lens::decoder
{
    DecodedEvent assembleEvent(const LogRecord & record,
                               std::string signature,
                               std::vector<DecodedArgument> topic_arguments,
                               std::vector<DecodedArgument> data_arguments)
    {
        DecodedEvent event{
            .hash = record.transaction_hash,
            .block = std::to_string(record.block_number),
            .signature = std::move(signature),
            .arguments = std::move(topic_arguments)
        };

        event.arguments.insert(event.arguments.end(),
            std::make_move_iterator(data_arguments.begin()),
            std::make_move_iterator(data_arguments.end()));

        return event;
    }

    Result<json> mergeIntoRecord(json input, const DecodedEvent & event)
    {
        if(!input.is_object())
        {
            return std::unexpected(Error{Error::Kind::MALFORMED_INPUT, "log record is not an object"});
        }

        json arguments = json::array();
        for(const DecodedArgument & argument : event.arguments)
        {
            auto argument_res = parse::parseToJson(argument, parse::use_json);
            if(!argument_res)
            {
                return std::unexpected(Error{Error::Kind::MALFORMED_INPUT,
                    std::format("cannot serialize argument {}: {}", argument.name, argument_res.error().message)});
            }
            arguments.emplace_back(std::move(*argument_res));
        }

        input["hash"] = event.hash;
        input["block"] = event.block;
        input["signature"] = event.signature;
        input["arguments"] = std::move(arguments);

        return input;
    }
}
