/// @file Sequence.hpp
/// @brief Straight-line composition of parsers with explicit short-circuiting.
#pragma once

#include <PARC/Parsing/BaseParsers.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace PARC::Parsing
{
    /// @brief Step function handed to a `Sequence` builder.
    ///
    /// Each call runs one parser against the state threaded through the scope. The first
    /// failing step aborts the scope: later steps return an empty optional without running
    /// their parser, and the enclosing sequence fails with the recorded state.
    ///
    /// @code
    /// auto swapped = Sequence([](SequenceScope& s) {
    ///     auto x = s(Token());
    ///     if (!x)
    ///         return s.Abort<std::string>();
    ///     auto y = s(Token());
    ///     if (!y)
    ///         return s.Abort<std::string>();
    ///     return Value(std::string {*y, *x});
    /// });
    /// @endcode
    class SequenceScope
    {
    public:
        explicit SequenceScope(ParseState state) noexcept
            : m_state(std::move(state))
        {
        }

        SequenceScope(const SequenceScope&)            = delete;
        SequenceScope& operator=(const SequenceScope&) = delete;

        /// @brief Runs `parser` and returns its value, or nothing if it (or an earlier step) failed.
        template<typename T>
        [[nodiscard]] std::optional<T> operator()(const Parser<T>& parser)
        {
            if (m_aborted)
                return std::nullopt;

            ParseResult<T> result = parser.Run(m_state);
            m_state               = std::move(result.state);
            if (m_state.HasError())
            {
                m_aborted = true;
                return std::nullopt;
            }
            return std::move(result.value);
        }

        /// @brief Parser for the builder's early-exit path.
        ///
        /// The sequence discards it when the scope is aborted; returned without a prior
        /// failure it fails with "sequence aborted".
        template<typename T>
        [[nodiscard]] Parser<T> Abort() const
        {
            return Fail<T>("sequence aborted");
        }

        [[nodiscard]] bool Aborted() const noexcept { return m_aborted; }

        [[nodiscard]] const ParseState& State() const noexcept { return m_state; }

    private:
        ParseState m_state;
        bool       m_aborted {false};
    };

    /// @brief Builds a parser from straight-line code.
    ///
    /// `builder` is invoked once per run with a fresh `SequenceScope`. On the all-steps-succeeded
    /// path the parser it returns runs against the final threaded state; after a failed step the
    /// sequence yields the failed state.
    template<typename Builder>
        requires ParserType<std::invoke_result_t<const Builder&, SequenceScope&>>
    [[nodiscard]] auto Sequence(Builder builder) -> Parser<ParserValueT<std::invoke_result_t<const Builder&, SequenceScope&>>>
    {
        using T = ParserValueT<std::invoke_result_t<const Builder&, SequenceScope&>>;
        return Parser<T>([builder = std::move(builder)](const ParseState& state) -> ParseResult<T> {
            SequenceScope   scope {state};
            const Parser<T> last = std::invoke(builder, scope);
            if (scope.Aborted())
                return ParseResult<T>::Failure(scope.State());
            return last.Run(scope.State());
        });
    }
}// namespace PARC::Parsing
