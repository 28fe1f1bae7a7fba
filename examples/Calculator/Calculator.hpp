// Calculator.hpp
#pragma once

#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include <PARC/PARC.hpp>

namespace Calculator
{
    using namespace PARC;
    using namespace PARC::Parsing;

    // Operator followed by its right-hand operand
    using Operation = std::pair<Char, Int64>;

    template<typename T>
    Parser<T> Lexeme(Parser<T> parser)
    {
        return FollowedBy(std::move(parser), Maybe(Spaces()));
    }

    // Computes `lhs symbol rhs`, or the reason it has no Int64 result
    inline std::expected<Int64, std::string> Apply(Char symbol, Int64 lhs, Int64 rhs)
    {
        constexpr Int64 max = std::numeric_limits<Int64>::max();
        constexpr Int64 min = std::numeric_limits<Int64>::min();

        switch (symbol)
        {
            case '+':
                if ((rhs > 0 && lhs > max - rhs) || (rhs < 0 && lhs < min - rhs))
                    return std::unexpected(std::string {"arithmetic overflow"});
                return lhs + rhs;
            case '-':
                if ((rhs < 0 && lhs > max + rhs) || (rhs > 0 && lhs < min + rhs))
                    return std::unexpected(std::string {"arithmetic overflow"});
                return lhs - rhs;
            case '*':
            {
                bool overflow = false;
                if (lhs > 0)
                    overflow = rhs > 0 ? lhs > max / rhs : rhs < min / lhs;
                else if (lhs < 0)
                    overflow = rhs > 0 ? lhs < min / rhs : (rhs != 0 && lhs < max / rhs);
                if (overflow)
                    return std::unexpected(std::string {"arithmetic overflow"});
                return lhs * rhs;
            }
            case '/':
                if (rhs == 0)
                    return std::unexpected(std::string {"division by zero"});
                if (lhs == min && rhs == -1)
                    return std::unexpected(std::string {"arithmetic overflow"});
                return lhs / rhs;
            default: return std::unexpected(std::string {"unknown operator"});
        }
    }

    // Folds `operand (op operand)*` from left to right
    inline Parser<Int64> LeftChain(Parser<Int64> operand, std::string operators)
    {
        auto operation = Sequence([operand, op = Lexeme(OneOf(std::move(operators)))](SequenceScope& s) {
            auto symbol = s(op);
            if (!symbol)
                return s.Abort<Operation>();
            auto rhs = s(operand);
            if (!rhs)
                return s.Abort<Operation>();
            return Value(Operation {*symbol, *rhs});
        });

        return Sequence([operand, rest = ZeroOrMore(std::move(operation))](SequenceScope& s) {
            auto first = s(operand);
            if (!first)
                return s.Abort<Int64>();
            auto operations = s(rest);
            if (!operations)
                return s.Abort<Int64>();

            Int64 accumulator = *first;
            for (const auto& [symbol, value] : *operations)
            {
                const auto result = Apply(symbol, accumulator, value);
                if (!result)
                    return Fail<Int64>(result.error());
                accumulator = *result;
            }
            return Value(accumulator);
        });
    }

    /// @brief Integer arithmetic over `+ - * /` with parentheses.
    class Evaluator
    {
    public:
        explicit Evaluator(const TraceSink& sink = {})
        {
            auto number      = Trace("number", Lexeme(Integer()), sink);
            auto nested      = Lazy([this] { return m_expression; });
            auto parenthesis = Sequence([nested, open = Lexeme(Character('(')), close = Lexeme(Character(')'))](SequenceScope& s) {
                if (!s(open))
                    return s.Abort<Int64>();
                auto value = s(nested);
                if (!value || !s(close))
                    return s.Abort<Int64>();
                return Value(*value);
            });

            auto factor  = Trace("factor", Or(number, parenthesis), sink);
            auto term    = Trace("term", LeftChain(factor, "*/"), sink);
            m_expression = Trace("expression", LeftChain(term, "+-"), sink);
            m_program    = And(Maybe(Spaces()), FollowedBy(m_expression, Eof()));
        }

        // Parsers refer back to this instance.
        Evaluator(const Evaluator&)            = delete;
        Evaluator& operator=(const Evaluator&) = delete;

        ParseExpected<Int64> Evaluate(std::string_view input, const ParseOptions& options = {}) const
        {
            return Parse(m_program, input, options);
        }

    private:
        Parser<Int64> m_expression;
        Parser<Int64> m_program;
    };
}// namespace Calculator
