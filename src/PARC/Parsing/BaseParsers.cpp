#include <PARC/Parsing/BaseParsers.hpp>

namespace PARC::Parsing
{
    Parser<Char> Token()
    {
        return Parser<Char>([](const ParseState& state) -> ParseResult<Char> {
            if (state.remaining.empty())
                return detail::MakeFailure<Char>(state, "unexpected eof", std::string {ErrorTypes::Eof});

            const Char unit = state.remaining.front();
            ParseState next {state};
            next.remaining.remove_prefix(1);
            next.position = state.position.Advance(unit);
            return ParseResult<Char>::Success(std::move(next), unit);
        });
    }

    Parser<bool> Eof()
    {
        return Parser<bool>([](const ParseState& state) -> ParseResult<bool> {
            if (!state.remaining.empty())
                return detail::MakeFailure<bool>(state, "expected an eof", std::string {ErrorTypes::Expectation});
            return ParseResult<bool>::Success(state, true);
        });
    }
}// namespace PARC::Parsing
