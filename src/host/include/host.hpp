#pragma once

#include <optional>
#include <string_view>

#include "decoder.hpp"
#include "parameter_store.hpp"
#include "stream.hpp"

namespace lens::host
{
    /**
     * @brief The decoder as seen by a hosting runtime.
     * 
     * The host configures the module with setParam and then calls transform once per
     * record it wants processed. The module pulls each record from its InputSource.
     */
    class Module
    {
        public:
            explicit Module(InputSource & input);

            Module(const Module &) = delete;
            Module & operator=(const Module &) = delete;

            /**
             * @brief Stores new parameters.
             * 
             * @param payload JSON text of the form {"abi": "<abi json text>"}, std::nullopt when the host sent nothing.
             * @return NOT_CONFIGURED for a missing payload, MALFORMED_INPUT when it cannot be deserialized.
             */
            decoder::Result<void> setParam(std::optional<std::string_view> payload);

            /**
             * @brief Pulls the next record and decodes it.
             * 
             * Nil and EndOfStream are passed on as they are. A record that matches no event,
             * or any record while the ABI is malformed, is returned unchanged.
             */
            decoder::Result<StreamOption> transform();

            const config::ParameterStore & parameters() const;

        private:
            InputSource & _input;
            config::ParameterStore _parameters;
    };
}
