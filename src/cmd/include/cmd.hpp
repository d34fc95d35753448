#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lens::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs
        {
            Zero = 0,
            One
        };

        enum class Type
        {
            Bool = 0,
            String
        };

        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string description;
    };

    /**
     * @brief Minimal command line parser.
     * 
     * Arguments are registered by name, parsed once, then queried with getArg.
     * Unknown arguments are logged and ignored.
     */
    class ArgParser
    {
        public:
            void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description);

            /**
             * @return false when an option that takes a value has none.
             */
            bool parse(int argc, char* argv[]);

            /**
             * @brief Value of a parsed argument.
             * 
             * Supported T: bool (presence), std::vector<std::string>.
             */
            template<class T>
            std::optional<T> getArg(const std::string & name) const;

            std::string constructHelpMessage() const;

        private:
            std::vector<std::string> _order;
            std::map<std::string, CommandLineArgDef> _defs;
            std::map<std::string, std::vector<std::string>> _values;
    };

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const;
}
