#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace lens::parse
{
    /**
     * @brief Why a log record, an ABI or a parameter payload could not be read.
     *
     * `field` is the path of the offending value, e.g. `topics[1]` or
     * `abi[2].inputs[0].type`; it is empty when the whole document is at fault.
     */
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN             = 0U,

            INVALID_JSON        = 1U,
            MISSING_FIELD       = 2U,
            TYPE_MISMATCH       = 3U,
            OUT_OF_RANGE        = 4U,
            INVALID_QUANTITY    = 5U
        };

        Kind kind = Kind::UNKNOWN;
        std::string field = "";
        std::string message = "";

        /**
         * @brief Same error, reported one level deeper in the document.
         */
        Error nested(const std::string & parent) const
        {
            return Error{kind, field.empty() ? parent : std::format("{}.{}", parent, field), message};
        }
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<lens::parse::Error::Kind> : std::formatter<std::string> {
    auto format(const lens::parse::Error::Kind & kind, format_context& ctx) const {
        switch(kind)
        {
            case lens::parse::Error::Kind::INVALID_JSON : return formatter<string>::format("Invalid json", ctx);
            case lens::parse::Error::Kind::MISSING_FIELD : return formatter<string>::format("Missing field", ctx);
            case lens::parse::Error::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);
            case lens::parse::Error::Kind::OUT_OF_RANGE : return formatter<string>::format("Out of range", ctx);
            case lens::parse::Error::Kind::INVALID_QUANTITY : return formatter<string>::format("Invalid quantity", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
    }
};

template <>
struct std::formatter<lens::parse::Error> : std::formatter<std::string> {
    auto format(const lens::parse::Error & err, format_context& ctx) const {
        if(err.field.empty())
        {
            return formatter<string>::format(std::format("{}: {}", err.kind, err.message), ctx);
        }
        return formatter<string>::format(std::format("{} at {}: {}", err.kind, err.field, err.message), ctx);
    }
};
