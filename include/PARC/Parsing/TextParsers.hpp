/// @file TextParsers.hpp
/// @brief Character and string parsers built on the core combinators.
#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Parsing/BaseParsers.hpp>
#include <PARC/Parsing/Combinators.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace PARC::Parsing
{
    /// @brief Consumes one token accepted by `predicate`.
    ///
    /// Fails with "token does not match predicate" otherwise.
    /// @throws std::invalid_argument if `predicate` is empty.
    [[nodiscard]] PARC_API Parser<Char> Satisfies(std::function<bool(Char)> predicate);

    [[nodiscard]] PARC_API Parser<Char> Character(Char expected);

    /// @brief Accepts a token contained in `characters`.
    [[nodiscard]] PARC_API Parser<Char> OneOf(std::string characters);

    /// @brief Accepts a token not contained in `characters`.
    [[nodiscard]] PARC_API Parser<Char> NoneOf(std::string characters);

    /// @brief Matches `text` one character at a time and yields it.
    [[nodiscard]] PARC_API Parser<std::string> String(std::string text);

    /// @brief Accepts a character that is a digit in `base` (2 to 36, letters in either case).
    /// @throws std::invalid_argument if `base` is out of range.
    [[nodiscard]] PARC_API Parser<Char> DigitCharacter(UInt32 base = 10);

    /// @brief Accepts one of space, tab, newline or carriage return.
    [[nodiscard]] PARC_API Parser<Char> Space();

    /// @brief Accepts one or more whitespace characters and yields a single `' '`.
    [[nodiscard]] PARC_API Parser<Char> Spaces();

    template<typename T>
    concept StringPiece = std::same_as<T, Char> || std::convertible_to<const T&, std::string_view>;

    /// @brief Concatenates the pieces produced by `parser` into one string.
    template<StringPiece T>
    [[nodiscard]] Parser<std::string> StringOf(Parser<std::vector<T>> parser)
    {
        return Map(std::move(parser), [](const std::vector<T>& pieces) {
            std::string joined;
            for (const T& piece : pieces)
            {
                if constexpr (std::same_as<T, Char>)
                    joined.push_back(piece);
                else
                    joined.append(std::string_view {piece});
            }
            return joined;
        });
    }

    /// @brief One or more matches of `parser`, concatenated into a string.
    template<StringPiece T>
    [[nodiscard]] Parser<std::string> Text(Parser<T> parser)
    {
        return StringOf(OneOrMore(std::move(parser)));
    }

    /// @brief One or more tokens, concatenated into a string.
    [[nodiscard]] PARC_API Parser<std::string> Text();
}// namespace PARC::Parsing
