#include "cmd.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace lens::cmd
{
    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description)
    {
        if(!_defs.contains(name))
        {
            _order.push_back(name);
        }
        _defs[std::move(name)] = CommandLineArgDef{nargs, type, std::move(description)};
    }

    bool ArgParser::parse(int argc, char* argv[])
    {
        _values.clear();

        for(int i = 1; i < argc; ++i)
        {
            const std::string name = argv[i];
            const auto def_it = _defs.find(name);
            if(def_it == _defs.end())
            {
                spdlog::warn("Unknown argument {}", name);
                continue;
            }

            const CommandLineArgDef & def = def_it->second;
            std::vector<std::string> & values = _values[name];

            if(def.nargs == CommandLineArgDef::NArgs::Zero)
            {
                continue;
            }

            if(i + 1 < argc && !_defs.contains(argv[i + 1]))
            {
                values.push_back(argv[++i]);
            }

            if(values.empty())
            {
                spdlog::error("Argument {} expects a value", name);
                return false;
            }
        }

        return true;
    }

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const
    {
        if(!_defs.contains(name))
        {
            return std::nullopt;
        }
        return _values.contains(name);
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end() || it->second.empty())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::string message = "Options:\n";
        for(const std::string & name : _order)
        {
            const CommandLineArgDef & def = _defs.at(name);
            const std::string value_hint = def.nargs == CommandLineArgDef::NArgs::One ? " <value>" : "";
            message += std::format("  {:<24}{}\n", name + value_hint, def.description);
        }
        return message;
    }
}
