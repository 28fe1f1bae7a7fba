/// @file BaseParsers.hpp
/// @brief Primitive parsers and the monadic building blocks every combinator is made of.
#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Parsing/Parser.hpp>

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace PARC::Parsing
{
    namespace detail
    {
        /// @brief Failed result at `state`, merging with any error `state` already carries.
        template<typename T>
        [[nodiscard]] ParseResult<T> MakeFailure(const ParseState& state, std::string message, std::string type)
        {
            ParseError error {state.position, {std::move(message)}, std::move(type)};
            return ParseResult<T>::Failure(state.WithError(MergeErrors(state.error, std::optional<ParseError> {std::move(error)})));
        }
    }// namespace detail

    /// @brief Parser that succeeds with `value` without consuming input.
    template<typename T>
    [[nodiscard]] Parser<T> Value(T value)
    {
        return Parser<T>([value = std::move(value)](const ParseState& state) {
            return ParseResult<T>::Success(state, value);
        });
    }

    /// @brief Parser that succeeds with `Unit` without consuming input.
    [[nodiscard]] inline Parser<Unit> Value()
    {
        return Value(Unit {});
    }

    /// @brief Parser that always fails at the current position without consuming input.
    ///
    /// An empty `message` or `type` falls back to "parser error" and "failure".
    template<typename T = Unit>
    [[nodiscard]] Parser<T> Fail(std::string message = "parser error", std::string type = std::string {ErrorTypes::Failure})
    {
        if (message.empty())
            message = "parser error";
        if (type.empty())
            type = std::string {ErrorTypes::Failure};
        return Parser<T>([message = std::move(message), type = std::move(type)](const ParseState& state) {
            return detail::MakeFailure<T>(state, message, type);
        });
    }

    /// @brief Consumes a single input unit. Fails with "unexpected eof" (type "eof") on empty input.
    [[nodiscard]] PARC_API Parser<Char> Token();

    /// @brief Succeeds with `true` at end of input; fails with "expected an eof" otherwise. Never consumes.
    [[nodiscard]] PARC_API Parser<bool> Eof();

    /// @brief Runs `parser`, then the parser returned by `continuation(value)`.
    ///
    /// `continuation` is only invoked when `parser` succeeds; a failure propagates unchanged.
    template<typename A, typename F>
        requires ParserType<std::invoke_result_t<const F&, const A&>>
    [[nodiscard]] auto Bind(Parser<A> parser, F continuation)
            -> Parser<ParserValueT<std::invoke_result_t<const F&, const A&>>>
    {
        using B = ParserValueT<std::invoke_result_t<const F&, const A&>>;
        return Parser<B>([parser = std::move(parser), continuation = std::move(continuation)](const ParseState& state) -> ParseResult<B> {
            ParseResult<A> first = parser.Run(state);
            if (first.Failed())
                return ParseResult<B>::Failure(std::move(first.state));
            const Parser<B> next = std::invoke(continuation, std::as_const(*first.value));
            return next.Run(first.state);
        });
    }

    /// @brief Transforms the value of `parser` with `function`.
    template<typename A, typename F>
        requires std::is_invocable_v<const F&, const A&>
    [[nodiscard]] auto Map(Parser<A> parser, F function) -> Parser<std::decay_t<std::invoke_result_t<const F&, const A&>>>
    {
        using B = std::decay_t<std::invoke_result_t<const F&, const A&>>;
        return Parser<B>([parser = std::move(parser), function = std::move(function)](const ParseState& state) -> ParseResult<B> {
            ParseResult<A> result = parser.Run(state);
            if (result.Failed())
                return ParseResult<B>::Failure(std::move(result.state));
            B mapped = std::invoke(function, std::as_const(*result.value));
            return ParseResult<B>::Success(std::move(result.state), std::move(mapped));
        });
    }

    /// @brief Defers obtaining a parser until it runs.
    ///
    /// Used to tie recursive grammars together: `factory` is called on every run and typically
    /// returns a copy of a parser declared later, captured by reference.
    template<typename F>
        requires ParserType<std::invoke_result_t<const F&>>
    [[nodiscard]] auto Lazy(F factory) -> Parser<ParserValueT<std::invoke_result_t<const F&>>>
    {
        using T = ParserValueT<std::invoke_result_t<const F&>>;
        return Parser<T>([factory = std::move(factory)](const ParseState& state) {
            const Parser<T> parser = std::invoke(factory);
            return parser.Run(state);
        });
    }

    /// @brief Yields a copy of the user state as `U`.
    ///
    /// Fails with type "expectation" when no user state is set or it holds another type.
    template<typename U>
    [[nodiscard]] Parser<U> GetUserState()
    {
        return Parser<U>([](const ParseState& state) -> ParseResult<U> {
            const U* value = state.userState ? std::any_cast<U>(state.userState.get()) : nullptr;
            if (value == nullptr)
                return detail::MakeFailure<U>(state, "user state does not hold the requested type", std::string {ErrorTypes::Expectation});
            return ParseResult<U>::Success(state, *value);
        });
    }

    /// @brief Replaces the user state with `value`.
    template<typename U>
    [[nodiscard]] Parser<Unit> SetUserState(U value)
    {
        UserState replacement = std::make_shared<std::any>(std::move(value));
        return Parser<Unit>([replacement = std::move(replacement)](const ParseState& state) {
            return ParseResult<Unit>::Success(state.WithUserState(replacement), Unit {});
        });
    }

    /// @brief Replaces the user state with `function(current)`, where `current` is read as `U`.
    template<typename U, typename F>
        requires std::is_invocable_r_v<U, const F&, const U&>
    [[nodiscard]] Parser<Unit> UpdateUserState(F function)
    {
        return Bind(GetUserState<U>(), [function = std::move(function)](const U& current) {
            return SetUserState<U>(std::invoke(function, current));
        });
    }
}// namespace PARC::Parsing
