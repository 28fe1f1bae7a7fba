/// @file Parse.hpp
/// @brief Entry point running a parser over a complete input.
#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Exceptions/ParseException.hpp>
#include <PARC/Parsing/Parser.hpp>

#include <any>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace PARC::Parsing
{
    /// @brief Parse configuration.
    struct ParseOptions
    {
        /// Throw `ParseException` on failure instead of returning the error.
        bool        throwOnError {true};
        /// Source name attached to every reported position.
        std::string fileName {};
        /// Initial user state; left unset when empty.
        std::any    userState {};
    };

    /// @brief State at the start of `input`.
    [[nodiscard]] PARC_API ParseState MakeInitialState(std::string_view input, const ParseOptions& options = {});

    /// @brief Runs `parser` over `input`.
    ///
    /// @return The parsed value, or the error when the parse fails and `throwOnError` is false.
    /// @throws PARC::Exceptions::ParseException when the parse fails and `throwOnError` is true.
    template<typename T>
    [[nodiscard]] ParseExpected<T> Parse(const Parser<T>& parser, std::string_view input, const ParseOptions& options = {})
    {
        ParseResult<T> result = parser.Run(MakeInitialState(input, options));
        if (result.Failed())
        {
            if (options.throwOnError)
                throw Exceptions::ParseException(std::move(*result.state.error));
            return std::unexpected(std::move(*result.state.error));
        }
        return ParseExpected<T> {std::in_place, std::move(*result.value)};
    }
}// namespace PARC::Parsing
