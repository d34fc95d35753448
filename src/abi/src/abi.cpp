#include "abi.hpp"

#include <format>

namespace lens::abi
{
    std::string constructSignature(const EventDefinition & event)
    {
        std::string signature = event.name + "(";
        for(std::size_t i = 0; i < event.inputs.size(); ++i)
        {
            if(i != 0) signature += ",";
            signature += event.inputs[i].type;
        }
        signature += ")";
        return signature;
    }

    parse::Result<std::vector<EventDefinition>> parseAbi(std::string_view abi_text)
    {
        json abi_json = json::parse(abi_text, nullptr, false);
        if(abi_json.is_discarded())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_JSON, "", "abi is not a json document"});
        }

        if(!abi_json.is_array())
        {
            return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, "", "abi is not an array"});
        }

        std::vector<EventDefinition> events;
        for(std::size_t i = 0; i < abi_json.size(); ++i)
        {
            json & item = abi_json[i];
            if(!item.is_object())
            {
                return std::unexpected(parse::Error{parse::Error::Kind::TYPE_MISMATCH, std::format("abi[{}]", i), "entry is not an object"});
            }

            const auto type_it = item.find("type");
            if(type_it == item.end() || !type_it->is_string() || type_it->get<std::string>() != "event")
            {
                continue;
            }

            auto event_res = parse::parseFromJson<EventDefinition>(std::move(item), parse::use_json);
            if(!event_res)
            {
                return std::unexpected(event_res.error().nested(std::format("abi[{}]", i)));
            }

            events.emplace_back(std::move(*event_res));
        }

        return events;
    }
}

namespace lens::parse
{
    template<>
    Result<abi::ParameterDefinition> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "", "input is not an object"});
        }

        abi::ParameterDefinition param;
        if (json_obj.contains("type") && json_obj["type"].is_string()) {
            param.type = json_obj["type"].get<std::string>();
        }
        else return std::unexpected(Error{Error::Kind::MISSING_FIELD, "type", "expected a type string"});

        // unnamed parameters are legal in solidity
        if (json_obj.contains("name")) {
            if(!json_obj["name"].is_string()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "name", "expected a string"});
            param.name = json_obj["name"].get<std::string>();
        }

        if (json_obj.contains("indexed")) {
            if(!json_obj["indexed"].is_boolean()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "indexed", "expected a boolean"});
            param.indexed = json_obj["indexed"].get<bool>();
        }

        return param;
    }

    template<>
    Result<abi::EventDefinition> parseFromJson(json json_obj, use_json_t)
    {
        abi::EventDefinition event;
        if (json_obj.contains("name") && json_obj["name"].is_string()) {
            event.name = json_obj["name"].get<std::string>();
        }
        else return std::unexpected(Error{Error::Kind::MISSING_FIELD, "name", "expected an event name"});

        if (!json_obj.contains("inputs") || json_obj["inputs"].is_null()) {
            return event;
        }

        if (!json_obj["inputs"].is_array()) {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "inputs", std::format("inputs of {} is not an array", event.name)});
        }

        json & inputs = json_obj["inputs"];
        for(std::size_t i = 0; i < inputs.size(); ++i)
        {
            auto param_res = parseFromJson<abi::ParameterDefinition>(std::move(inputs[i]), use_json);
            if(!param_res)
            {
                return std::unexpected(param_res.error().nested(std::format("inputs[{}]", i)));
            }
            event.inputs.emplace_back(std::move(*param_res));
        }

        return event;
    }
}
