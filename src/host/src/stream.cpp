#include "stream.hpp"

#include <format>
#include <string>

namespace lens::host
{
    namespace
    {
        bool _isBlank(const std::string & line)
        {
            return line.find_first_not_of(" \t\r") == std::string::npos;
        }
    }

    JsonLinesSource::JsonLinesSource(std::istream & input)
    :   _input(input)
    {
    }

    decoder::Result<StreamOption> JsonLinesSource::next()
    {
        std::string line;
        while(std::getline(_input, line))
        {
            ++_line_number;
            if(_isBlank(line))
            {
                continue;
            }

            json record = json::parse(line, nullptr, false);
            if(record.is_discarded())
            {
                return std::unexpected(decoder::Error{decoder::Error::Kind::MALFORMED_INPUT,
                    std::format("line {} is not valid json", _line_number)});
            }

            if(record.is_null())
            {
                return Nil{};
            }

            if(!record.is_object())
            {
                return std::unexpected(decoder::Error{decoder::Error::Kind::MALFORMED_INPUT,
                    std::format("line {} is not a json object", _line_number)});
            }

            return record;
        }

        return EndOfStream{};
    }

    std::size_t JsonLinesSource::lineNumber() const
    {
        return _line_number;
    }

    JsonLinesSink::JsonLinesSink(std::ostream & output)
    :   _output(output)
    {
    }

    bool JsonLinesSink::write(const decoder::Result<StreamOption> & completion)
    {
        if(!completion)
        {
            _output << json{{"error", completion.error().message}}.dump() << '\n';
            return true;
        }

        if(std::holds_alternative<EndOfStream>(*completion))
        {
            _output.flush();
            return false;
        }

        if(std::holds_alternative<Nil>(*completion))
        {
            _output << "null\n";
            return true;
        }

        _output << std::get<json>(*completion).dump() << '\n';
        return true;
    }
}
