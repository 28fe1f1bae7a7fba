#pragma once

#include <PARC/Parsing/ParseError.hpp>
#include <PARC/Parsing/SourcePosition.hpp>

#include <any>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace PARC::Parsing
{
    /// @brief Explicit "no value" marker produced by parsers that have nothing to return.
    struct Unit
    {
        [[nodiscard]] constexpr bool operator==(const Unit&) const noexcept = default;
    };

    /// @brief Caller-supplied auxiliary data threaded through a parse.
    ///
    /// The payload is immutable; parsers that change it install a new payload.
    using UserState = std::shared_ptr<const std::any>;

    /// @brief Snapshot of the parse cursor.
    ///
    /// States are never modified in place by parsers: every transformation copies the state
    /// and overrides the fields that change.
    struct ParseState
    {
        std::string_view          remaining {};
        SourcePosition            position {};
        UserState                 userState {};
        std::optional<ParseError> error {};

        [[nodiscard]] bool HasError() const noexcept { return error.has_value(); }

        [[nodiscard]] ParseState WithError(std::optional<ParseError> newError) const
        {
            ParseState next {*this};
            next.error = std::move(newError);
            return next;
        }

        [[nodiscard]] ParseState WithoutError() const { return WithError(std::nullopt); }

        [[nodiscard]] ParseState WithUserState(UserState newUserState) const
        {
            ParseState next {*this};
            next.userState = std::move(newUserState);
            return next;
        }
    };

    /// @brief State produced by running a parser, together with the value it produced.
    ///
    /// Exactly one of `value` and `state.error` is set.
    template<typename T>
    struct ParseResult
    {
        using ValueType = T;

        ParseState       state {};
        std::optional<T> value {};

        [[nodiscard]] bool Failed() const noexcept { return state.error.has_value(); }
        [[nodiscard]] bool Succeeded() const noexcept { return !Failed(); }

        /// @brief Successful result; any error carried by `state` is dropped.
        [[nodiscard]] static ParseResult Success(ParseState state, T value)
        {
            state.error.reset();
            return ParseResult {std::move(state), std::optional<T> {std::move(value)}};
        }

        /// @brief Failed result. `state` must carry the error.
        [[nodiscard]] static ParseResult Failure(ParseState state)
        {
            return ParseResult {std::move(state), std::nullopt};
        }
    };
}// namespace PARC::Parsing
