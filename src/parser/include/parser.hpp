#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include "parse_error.hpp"

namespace lens::parse
{   
    /**
     * @brief A tag type selecting the nlohmann::json parsers.
     * 
     * Parsers are overloaded on this tag so that the same message type can gain
     * other encodings without changing call sites.
     */
    struct use_json_t{};

    /**
     * @brief Tag value for the nlohmann::json parsers.
     */
    static constexpr use_json_t use_json{};

    /**
     * @brief Converts a JSON value to a T.
     * 
     * @tparam T The message type.
     * @param json The JSON value to convert.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Parses JSON text and converts it to a T.
     * 
     * Syntax errors are reported as INVALID_JSON instead of escaping as exceptions.
     *
     * @tparam T The message type.
     * @param json_str The JSON text to convert.
     */
    template<class T>
    Result<T> parseFromJsonString(std::string_view json_str, use_json_t)
    {
        json json_obj = json::parse(json_str, nullptr, false);
        if(json_obj.is_discarded())
        {
            return std::unexpected(Error{Error::Kind::INVALID_JSON, "", "not a json document"});
        }
        return parseFromJson<T>(std::move(json_obj), use_json);
    }

    /**
     * @brief Converts a T to a JSON object.
     * 
     * @tparam T The message type.
     * @param message The message to convert.
     */
    template<class T>
    Result<json> parseToJson(T message, use_json_t);
}
