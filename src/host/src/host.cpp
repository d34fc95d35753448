#include "host.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace lens::host
{
    Module::Module(InputSource & input)
    :   _input(input)
    {
    }

    decoder::Result<void> Module::setParam(std::optional<std::string_view> payload)
    {
        if(!payload)
        {
            return std::unexpected(decoder::Error{decoder::Error::Kind::NOT_CONFIGURED, "Parameters have not been set."});
        }

        auto parameters_res = parse::parseFromJsonString<config::Parameters>(*payload, parse::use_json);
        if(!parameters_res)
        {
            return std::unexpected(decoder::Error{decoder::Error::Kind::MALFORMED_INPUT,
                std::format("Invalid parameters, {}", parameters_res.error())});
        }

        _parameters.set(std::move(*parameters_res));
        return {};
    }

    decoder::Result<StreamOption> Module::transform()
    {
        auto item_res = _input.next();
        if(!item_res)
        {
            spdlog::error(std::format("Cannot read input record: {}", item_res.error().message));
            return std::unexpected(item_res.error());
        }

        if(!std::holds_alternative<json>(*item_res))
        {
            return item_res;
        }

        auto output_res = decoder::transformLog(std::move(std::get<json>(*item_res)), _parameters);
        if(!output_res)
        {
            spdlog::error(std::format("Cannot decode log ({}): {}", output_res.error().kind, output_res.error().message));
            return std::unexpected(output_res.error());
        }

        return StreamOption{std::move(*output_res)};
    }

    const config::ParameterStore & Module::parameters() const
    {
        return _parameters;
    }
}
