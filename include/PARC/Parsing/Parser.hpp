#pragma once

#include <PARC/Parsing/ParseState.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace PARC::Parsing
{
    template<typename T>
    class Parser;

    template<typename P>
    struct IsParser : std::false_type
    {
    };

    template<typename T>
    struct IsParser<Parser<T>> : std::true_type
    {
    };

    /// @brief Satisfied by `Parser<T>` for any `T` (cv/ref-qualified included).
    template<typename P>
    concept ParserType = IsParser<std::remove_cvref_t<P>>::value;

    /// @brief Value type produced by parser type `P`.
    template<ParserType P>
    using ParserValueT = typename std::remove_cvref_t<P>::ValueType;

    /// @brief Satisfied by callables usable as the body of a `Parser<T>`.
    template<typename F, typename T>
    concept ParserFunction = std::is_invocable_r_v<ParseResult<T>, const F&, const ParseState&>;

    /// @brief Type-erased parser producing a value of type `T`.
    ///
    /// A parser is an immutable transformation from a `ParseState` to a `ParseResult<T>`.
    /// Copies share the same body, so passing parsers around by value is cheap and a parser can
    /// be reused by any number of enclosing combinators.
    ///
    /// @tparam T Value type produced on success.
    template<typename T>
    class Parser
    {
    public:
        using ValueType = T;

        /// @brief Constructs an empty parser. Running it throws `std::bad_function_call`.
        Parser() noexcept = default;

        /// @brief Constructs a parser from a state transformation.
        ///
        /// @tparam F Callable invocable as `ParseResult<T>(const ParseState&) const`.
        template<typename F>
            requires(ParserFunction<F, T> && !std::same_as<std::decay_t<F>, Parser>)
        explicit Parser(F&& function)
            : m_body(std::make_shared<Body<std::decay_t<F>>>(std::forward<F>(function)))
        {
        }

        /// @brief Runs the parser against `state`.
        [[nodiscard]] ParseResult<T> Run(const ParseState& state) const
        {
            if (!m_body)
                throw std::bad_function_call();
            return m_body->Run(state);
        }

        [[nodiscard]] ParseResult<T> operator()(const ParseState& state) const { return Run(state); }

        /// @brief True if the parser has a body.
        explicit operator bool() const noexcept { return m_body != nullptr; }

    private:
        struct Concept
        {
            virtual ~Concept()                                           = default;
            virtual ParseResult<T> Run(const ParseState& state) const = 0;
        };

        template<typename F>
        struct Body final : Concept
        {
            template<typename G>
            explicit Body(G&& fn)
                : function(std::forward<G>(fn))
            {
            }

            ParseResult<T> Run(const ParseState& state) const override
            {
                return std::invoke(function, state);
            }

            F function;
        };

        std::shared_ptr<const Concept> m_body {};
    };
}// namespace PARC::Parsing
