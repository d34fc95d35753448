#include "parameter_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace lens::config
{
    void ParameterStore::set(Parameters parameters)
    {
        std::unique_lock lock(_mutex);
        _parameters = std::move(parameters);
        spdlog::debug("Parameters updated, abi size {} bytes", _parameters->abi.size());
    }

    std::optional<Parameters> ParameterStore::get() const
    {
        std::shared_lock lock(_mutex);
        return _parameters;
    }

    bool ParameterStore::configured() const
    {
        std::shared_lock lock(_mutex);
        return _parameters.has_value();
    }
}

namespace lens::parse
{
    template<>
    Result<config::Parameters> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "", "parameters are not an object"});
        }

        config::Parameters parameters;
        if (json_obj.contains("abi")) {
            if(!json_obj["abi"].is_string()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "abi", "expected the abi as json text"});
            parameters.abi = json_obj["abi"].get<std::string>();
        }
        else return std::unexpected(Error{Error::Kind::MISSING_FIELD, "abi", "required"});

        return parameters;
    }
}
