#include "decoder.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace lens::decoder
{
    Result<std::optional<DecodedEvent>> decodeLog(const LogRecord & record, std::string_view abi_text)
    {
        if(record.topics.empty())
        {
            return std::unexpected(Error{Error::Kind::OUT_OF_BOUNDS, "log has no signature topic"});
        }

        const auto events_res = abi::parseAbi(abi_text);
        if(!events_res)
        {
            spdlog::warn(std::format("Cannot parse abi, {}; passing log through", events_res.error()));
            return std::nullopt;
        }

        const auto match = matchEvent(record.topics.front(), *events_res);
        if(!match)
        {
            spdlog::debug("No event matches topic {} of transaction {}", record.topics.front(), record.transaction_hash);
            return std::nullopt;
        }

        auto topic_arguments = decodeTopics(*match->definition, record.topics);
        if(!topic_arguments)
        {
            return std::unexpected(topic_arguments.error());
        }

        auto data_arguments = decodeData(*match->definition, record.data);
        if(!data_arguments)
        {
            return std::unexpected(data_arguments.error());
        }

        return assembleEvent(record, match->signature, std::move(*topic_arguments), std::move(*data_arguments));
    }

    Result<json> transformLog(json input, const config::ParameterStore & parameters)
    {
        const auto stored = parameters.get();
        if(!stored)
        {
            return std::unexpected(Error{Error::Kind::NOT_CONFIGURED, "Parameters have not been set."});
        }

        const auto record_res = parse::parseFromJson<LogRecord>(input, parse::use_json);
        if(!record_res)
        {
            return std::unexpected(Error{Error::Kind::MALFORMED_INPUT,
                std::format("{}", record_res.error())});
        }

        const auto decoded_res = decodeLog(*record_res, stored->abi);
        if(!decoded_res)
        {
            return std::unexpected(decoded_res.error());
        }

        if(!decoded_res->has_value())
        {
            return input;
        }

        return mergeIntoRecord(std::move(input), **decoded_res);
    }
}
