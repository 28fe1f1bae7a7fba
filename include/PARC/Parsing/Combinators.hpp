/// @file Combinators.hpp
/// @brief Sequencing, alternation, lookahead and repetition combinators.
#pragma once

#include <PARC/Parsing/BaseParsers.hpp>
#include <PARC/Parsing/Sequence.hpp>

#include <concepts>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace PARC::Parsing
{
    template<typename T>
    [[nodiscard]] Parser<T> And(Parser<T> parser)
    {
        return parser;
    }

    /// @brief Runs every parser in order and yields the value of the last one.
    ///
    /// Stops at the first failure, which becomes the result.
    template<typename A, typename B, typename... Rest>
    [[nodiscard]] auto And(Parser<A> first, Parser<B> second, Parser<Rest>... rest)
    {
        auto chained = Bind(std::move(first), [second = std::move(second)](const A&) { return second; });
        return And(std::move(chained), std::move(rest)...);
    }

    /// @brief Tries each alternative against the same input and yields the first success.
    ///
    /// A failed alternative never leaves its partial consumption visible to the next one. When
    /// all fail, the last failing state is returned carrying the messages of every attempt.
    ///
    /// @throws std::invalid_argument if `alternatives` is empty.
    template<typename T>
    [[nodiscard]] Parser<T> Or(std::vector<Parser<T>> alternatives)
    {
        if (alternatives.empty())
            throw std::invalid_argument("Or requires at least one alternative");
        if (alternatives.size() == 1)
            return alternatives.front();

        return Parser<T>([alternatives = std::move(alternatives)](const ParseState& state) -> ParseResult<T> {
            std::optional<ParseError> errors;
            for (UIntSize i = 0;; ++i)
            {
                ParseResult<T> attempt = alternatives[i].Run(state);
                if (attempt.Succeeded())
                    return attempt;

                errors = MergeErrors(errors, attempt.state.error);
                if (i + 1 == alternatives.size())
                {
                    attempt.state.error = std::move(errors);
                    return attempt;
                }
            }
        });
    }

    template<typename T, typename... Rest>
        requires(std::same_as<Rest, Parser<T>> && ...)
    [[nodiscard]] Parser<T> Or(Parser<T> first, Rest... rest)
    {
        std::vector<Parser<T>> alternatives;
        alternatives.reserve(1 + sizeof...(Rest));
        alternatives.push_back(std::move(first));
        (alternatives.push_back(std::move(rest)), ...);
        return Or(std::move(alternatives));
    }

    /// @brief Yields the value of `parser` if it succeeds, an empty optional otherwise. Always succeeds.
    template<typename T>
    [[nodiscard]] Parser<std::optional<T>> Maybe(Parser<T> parser)
    {
        auto present = Map(std::move(parser), [](const T& value) { return std::optional<T> {value}; });
        return Or(std::move(present), Value(std::optional<T> {}));
    }

    /// @brief Negative lookahead: succeeds with `true` if `parser` fails. Never consumes.
    template<typename T>
    [[nodiscard]] Parser<bool> Not(Parser<T> parser)
    {
        return Parser<bool>([parser = std::move(parser)](const ParseState& state) {
            if (parser.Run(state).Failed())
                return ParseResult<bool>::Success(state, true);
            return detail::MakeFailure<bool>(state, "expected parser to fail", std::string {ErrorTypes::Failure});
        });
    }

    /// @brief Like `And(rest...)`, but fails if `parser` succeeds first.
    template<typename T, typename... Rest>
    [[nodiscard]] auto Unless(Parser<T> parser, Parser<Rest>... rest)
    {
        return And(Not(std::move(parser)), std::move(rest)...);
    }

    /// @brief Yields the value of `parser` once all of `rest` have succeeded after it.
    template<typename A, typename... Rest>
    [[nodiscard]] Parser<A> FollowedBy(Parser<A> parser, Parser<Rest>... rest)
    {
        if constexpr (sizeof...(Rest) == 0)
        {
            return parser;
        }
        else
        {
            auto tail = And(std::move(rest)...);
            return Bind(std::move(parser), [tail = std::move(tail)](const A& head) {
                return Map(tail, [head](const auto&) { return head; });
            });
        }
    }

    /// @brief Applies `parser` until it fails and yields every value. Always succeeds.
    ///
    /// The returned state follows the last successful application. Repetition also stops after
    /// a success that consumed nothing; that success's value is kept as the final element, so
    /// `ZeroOrMore(Maybe(Character('x')))` on "xxy" yields 'x', 'x' and an empty optional.
    template<typename T>
    [[nodiscard]] Parser<std::vector<T>> ZeroOrMore(Parser<T> parser)
    {
        return Parser<std::vector<T>>([parser = std::move(parser)](const ParseState& state) {
            std::vector<T> values;
            ParseState     current {state};
            while (true)
            {
                ParseResult<T> step = parser.Run(current);
                if (step.Failed())
                    break;

                values.push_back(std::move(*step.value));
                const bool consumed = step.state.remaining.size() != current.remaining.size();
                current             = std::move(step.state);
                if (!consumed)
                    break;
            }
            return ParseResult<std::vector<T>>::Success(std::move(current), std::move(values));
        });
    }

    /// @brief Like `ZeroOrMore`, but requires at least one success.
    template<typename T>
    [[nodiscard]] Parser<std::vector<T>> OneOrMore(Parser<T> parser)
    {
        auto more = ZeroOrMore(parser);
        return Sequence([parser = std::move(parser), more = std::move(more)](SequenceScope& s) {
            auto head = s(parser);
            if (!head)
                return s.Abort<std::vector<T>>();
            auto tail = s(more);
            if (!tail)
                return s.Abort<std::vector<T>>();

            std::vector<T> values;
            values.reserve(1 + tail->size());
            values.push_back(std::move(*head));
            values.insert(values.end(), std::make_move_iterator(tail->begin()), std::make_move_iterator(tail->end()));
            return Value(std::move(values));
        });
    }

    /// @brief One `parser` match followed by any number of `separator parser` pairs.
    ///
    /// Yields the `parser` values; separators are discarded.
    template<typename T, typename S>
    [[nodiscard]] Parser<std::vector<T>> SeparatedBy(Parser<T> parser, Parser<S> separator)
    {
        auto more = ZeroOrMore(And(std::move(separator), parser));
        return Sequence([parser = std::move(parser), more = std::move(more)](SequenceScope& s) {
            auto head = s(parser);
            if (!head)
                return s.Abort<std::vector<T>>();
            auto tail = s(more);
            if (!tail)
                return s.Abort<std::vector<T>>();

            std::vector<T> values;
            values.reserve(1 + tail->size());
            values.push_back(std::move(*head));
            values.insert(values.end(), std::make_move_iterator(tail->begin()), std::make_move_iterator(tail->end()));
            return Value(std::move(values));
        });
    }
}// namespace PARC::Parsing
