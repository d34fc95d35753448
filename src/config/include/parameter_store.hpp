#pragma once

#include <optional>
#include <shared_mutex>
#include <string>

#include "parser.hpp"

namespace lens::config
{
    /**
     * @brief Module parameters as delivered by the host.
     */
    struct Parameters
    {
        // event ABI, JSON text
        std::string abi;
    };

    /**
     * @brief Holds the current module parameters.
     * 
     * Empty until the first set(). Readers take a shared lock and writers an exclusive one,
     * so a reader sees either the previous value or the new one in full.
     */
    class ParameterStore
    {
        public:
            ParameterStore() = default;

            ParameterStore(const ParameterStore &) = delete;
            ParameterStore & operator=(const ParameterStore &) = delete;

            /**
             * @brief Replaces the stored parameters.
             */
            void set(Parameters parameters);

            /**
             * @brief Copy of the stored parameters, std::nullopt when never set.
             */
            std::optional<Parameters> get() const;

            bool configured() const;

        private:
            mutable std::shared_mutex _mutex;
            std::optional<Parameters> _parameters;
    };
}

namespace lens::parse
{
    template<>
    Result<config::Parameters> parseFromJson(json json_obj, use_json_t);
}
