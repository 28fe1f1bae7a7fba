#include <PARC/Parsing/TextParsers.hpp>

#include "DigitValue.hpp"

#include <stdexcept>
#include <utility>

namespace PARC::Parsing
{
    Parser<Char> Satisfies(std::function<bool(Char)> predicate)
    {
        if (!predicate)
            throw std::invalid_argument("Satisfies requires a predicate");

        return Bind(Token(), [predicate = std::move(predicate)](const Char& unit) {
            if (predicate(unit))
                return Value(unit);
            return Fail<Char>("token does not match predicate");
        });
    }

    Parser<Char> Character(Char expected)
    {
        return Satisfies([expected](Char unit) { return unit == expected; });
    }

    Parser<Char> OneOf(std::string characters)
    {
        return Satisfies([characters = std::move(characters)](Char unit) {
            return characters.find(unit) != std::string::npos;
        });
    }

    Parser<Char> NoneOf(std::string characters)
    {
        return Satisfies([characters = std::move(characters)](Char unit) {
            return characters.find(unit) == std::string::npos;
        });
    }

    Parser<std::string> String(std::string text)
    {
        std::vector<Parser<Char>> units;
        units.reserve(text.size());
        for (const Char unit : text)
            units.push_back(Character(unit));

        return Parser<std::string>([text = std::move(text), units = std::move(units)](const ParseState& state) -> ParseResult<std::string> {
            ParseState current {state};
            for (const auto& unit : units)
            {
                ParseResult<Char> step = unit.Run(current);
                if (step.Failed())
                    return ParseResult<std::string>::Failure(std::move(step.state));
                current = std::move(step.state);
            }
            return ParseResult<std::string>::Success(std::move(current), text);
        });
    }

    Parser<Char> DigitCharacter(UInt32 base)
    {
        detail::ValidateBase(base);
        return Satisfies([base](Char unit) { return detail::DigitValue(unit) < base; });
    }

    Parser<Char> Space()
    {
        return OneOf(" \t\n\r");
    }

    Parser<Char> Spaces()
    {
        return And(OneOrMore(Space()), Value(' '));
    }

    Parser<std::string> Text()
    {
        return Text(Token());
    }
}// namespace PARC::Parsing
