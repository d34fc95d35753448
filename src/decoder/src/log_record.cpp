#include "log_record.hpp"

#include <charconv>
#include <format>
#include <optional>
#include <string_view>

namespace lens::parse
{
    namespace
    {
        std::optional<std::uint64_t> _parseHexQuantity(std::string_view value)
        {
            if(value.starts_with("0x"))
            {
                value.remove_prefix(2);
            }

            if(value.empty())
            {
                return std::nullopt;
            }

            std::uint64_t result = 0;
            const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result, 16);
            if(ec != std::errc{} || end != value.data() + value.size())
            {
                return std::nullopt;
            }
            return result;
        }
    }

    template<>
    Result<decoder::LogRecord> parseFromJson(json json_obj, use_json_t)
    {
        if(!json_obj.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "", "log record is not an object"});
        }

        decoder::LogRecord record;

        if (json_obj.contains("transactionHash") && !json_obj["transactionHash"].is_null()) {
            if(!json_obj["transactionHash"].is_string()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "transactionHash", "expected a string"});
            record.transaction_hash = json_obj["transactionHash"].get<std::string>();
        }

        if (json_obj.contains("blockNumber") && !json_obj["blockNumber"].is_null()) {
            const json & block_number = json_obj["blockNumber"];
            if(block_number.is_number_unsigned())
            {
                record.block_number = block_number.get<std::uint64_t>();
            }
            else if(block_number.is_number_integer())
            {
                const std::int64_t signed_block_number = block_number.get<std::int64_t>();
                if(signed_block_number < 0) return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, "blockNumber", "block number is negative"});
                record.block_number = static_cast<std::uint64_t>(signed_block_number);
            }
            else if(block_number.is_string())
            {
                const auto quantity = _parseHexQuantity(block_number.get<std::string>());
                if(!quantity) return std::unexpected(Error{Error::Kind::INVALID_QUANTITY, "blockNumber", "expected a hex quantity such as 0x1b4"});
                record.block_number = *quantity;
            }
            else return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "blockNumber", "expected an integer or a hex quantity"});
        }

        if (!json_obj.contains("topics")) {
            return std::unexpected(Error{Error::Kind::MISSING_FIELD, "topics", "required"});
        }

        if (json_obj["topics"].is_array()) {
            const json & topics = json_obj["topics"];
            for(std::size_t i = 0; i < topics.size(); ++i)
            {
                if(!topics[i].is_string()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("topics[{}]", i), "expected a hex string"});
                record.topics.push_back(topics[i].get<std::string>());
            }
        }
        else return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "topics", "expected an array"});

        if (json_obj.contains("data") && !json_obj["data"].is_null()) {
            if(!json_obj["data"].is_string()) return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "data", "expected a hex string"});
            record.data = json_obj["data"].get<std::string>();
        }

        return record;
    }

    template<>
    Result<json> parseToJson(decoder::DecodedArgument argument, use_json_t)
    {
        json json_obj = json::object();
        json_obj["name"] = argument.name;
        json_obj["type"] = argument.type;
        std::visit([&json_obj](const auto & value) { json_obj["value"] = value; }, argument.value);

        return json_obj;
    }
}
