#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace lens::decoder
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            NOT_CONFIGURED,
            MALFORMED_INPUT,
            OUT_OF_BOUNDS

        } kind = Kind::UNKNOWN;

        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<lens::decoder::Error::Kind> : std::formatter<std::string> {
    auto format(const lens::decoder::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case lens::decoder::Error::Kind::NOT_CONFIGURED : return formatter<string>::format("Not configured", ctx);
            case lens::decoder::Error::Kind::MALFORMED_INPUT : return formatter<string>::format("Malformed input", ctx);
            case lens::decoder::Error::Kind::OUT_OF_BOUNDS : return formatter<string>::format("Out of bounds", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
