#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <variant>

#include "error.hpp"
#include "parser.hpp"

namespace lens::host
{
    /// A record slot carrying no value.
    struct Nil{};

    /// No more records will follow.
    struct EndOfStream{};

    using StreamOption = std::variant<json, Nil, EndOfStream>;

    /**
     * @brief Pull-style supplier of log records.
     */
    class InputSource
    {
        public:
            virtual ~InputSource() = default;

            /**
             * @brief Returns the next record, Nil, EndOfStream, or an error when the record cannot be read.
             */
            virtual decoder::Result<StreamOption> next() = 0;
    };

    /**
     * @brief Reads one JSON object per line.
     * 
     * Blank lines are skipped and the literal `null` is Nil. End of input is EndOfStream.
     */
    class JsonLinesSource : public InputSource
    {
        public:
            explicit JsonLinesSource(std::istream & input);

            decoder::Result<StreamOption> next() override;

            std::size_t lineNumber() const;

        private:
            std::istream & _input;
            std::size_t _line_number = 0;
    };

    /**
     * @brief Writes one JSON line per completion.
     * 
     * A record is written as is, Nil as `null` and an error as `{"error": "<message>"}`.
     */
    class JsonLinesSink
    {
        public:
            explicit JsonLinesSink(std::ostream & output);

            /**
             * @return false once EndOfStream was written, true otherwise.
             */
            bool write(const decoder::Result<StreamOption> & completion);

        private:
            std::ostream & _output;
    };
}
