#pragma once

/// @file ParseException.hpp
/// @brief Declares the ParseException class.

#include <PARC/Exceptions/Exception.hpp>
#include <PARC/Parsing/ParseError.hpp>

#include <utility>

namespace PARC::Exceptions
{
    /// @class ParseException
    /// @brief Thrown by `PARC::Parsing::Parse` when a parse fails and `throwOnError` is set.
    ///
    /// @details
    /// The exception message is the rendered error (`ParseError::ToString`); the structured
    /// error stays available through `GetError`.
    class ParseException : public Exception
    {
    public:
        /// @brief Constructs from the error that ended the parse.
        /// @param error The failure reported by the outermost parser.
        explicit ParseException(PARC::Parsing::ParseError error)
            : Exception(error.ToString())
            , m_error(std::move(error))
        {
        }

        ParseException(const ParseException& other)            = default;
        ParseException(ParseException&& other) noexcept        = default;
        ParseException& operator=(const ParseException& other) = default;
        ParseException& operator=(ParseException&& other)      = default;

        ~ParseException() noexcept override = default;

        /// @brief Returns the structured parse error.
        [[nodiscard]] const PARC::Parsing::ParseError& GetError() const noexcept { return m_error; }

    private:
        PARC::Parsing::ParseError m_error;
    };
}// namespace PARC::Exceptions
