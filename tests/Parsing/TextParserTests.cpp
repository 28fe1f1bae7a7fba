#include <PARC/Parsing/Parse.hpp>
#include <PARC/Parsing/TextParsers.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace PARC;
using namespace PARC::Parsing;

namespace
{
    template<typename T>
    ParseResult<T> RunOn(const Parser<T>& parser, std::string_view input)
    {
        return parser.Run(MakeInitialState(input));
    }
}// namespace

TEST_CASE("Satisfies accepts tokens matching the predicate", "[parsing][text]")
{
    const auto upper = Satisfies([](Char unit) { return std::isupper(static_cast<unsigned char>(unit)) != 0; });

    const auto accepted = RunOn(upper, "Ab");
    REQUIRE(*accepted.value == 'A');
    REQUIRE(accepted.state.remaining == "b");

    const auto rejected = RunOn(upper, "ab");
    REQUIRE(rejected.Failed());
    REQUIRE(rejected.state.error->messages.front() == "token does not match predicate");

    const auto empty = RunOn(upper, "");
    REQUIRE(empty.Failed());
    REQUIRE(empty.state.error->type == "eof");
}

TEST_CASE("Satisfies rejects an empty predicate", "[parsing][text]")
{
    REQUIRE_THROWS_AS(Satisfies(nullptr), std::invalid_argument);
}

TEST_CASE("Character matches exactly one character", "[parsing][text]")
{
    REQUIRE(*RunOn(Character('a'), "abc").value == 'a');
    REQUIRE(RunOn(Character('a'), "bcd").Failed());
}

TEST_CASE("OneOf and NoneOf test set membership", "[parsing][text]")
{
    REQUIRE(*RunOn(OneOf("abc"), "b").value == 'b');
    REQUIRE(RunOn(OneOf("abc"), "d").Failed());

    REQUIRE(*RunOn(NoneOf("abc"), "d").value == 'd');
    REQUIRE(RunOn(NoneOf("abc"), "a").Failed());
    REQUIRE(RunOn(NoneOf("abc"), "").Failed());
}

TEST_CASE("String matches a literal prefix", "[parsing][text]")
{
    const auto result = RunOn(String("foo"), "foobarbaz");
    REQUIRE(*result.value == "foo");
    REQUIRE(result.state.remaining == "barbaz");
    REQUIRE(result.state.position.Column() == 4);

    REQUIRE(RunOn(String("foo"), "bar").Failed());
}

TEST_CASE("String fails just past the first mismatching character", "[parsing][text]")
{
    const auto result = RunOn(String("foo"), "fox");
    REQUIRE(result.Failed());
    REQUIRE(result.state.error->position.Column() == 4);
    REQUIRE(result.state.error->messages.front() == "token does not match predicate");
}

TEST_CASE("String of nothing always succeeds", "[parsing][text]")
{
    const auto result = RunOn(String(""), "abc");
    REQUIRE(result.Succeeded());
    REQUIRE(result.value->empty());
    REQUIRE(result.state.remaining == "abc");
}

TEST_CASE("String handles long literals", "[parsing][text]")
{
    const std::string literal(10000, 'z');
    const auto        result = RunOn(String(literal), literal);
    REQUIRE(result.Succeeded());
    REQUIRE(result.state.remaining.empty());
}

TEST_CASE("DigitCharacter honours the base", "[parsing][text]")
{
    REQUIRE(*RunOn(DigitCharacter(), "7").value == '7');
    REQUIRE(RunOn(DigitCharacter(), "a").Failed());
    REQUIRE(*RunOn(DigitCharacter(16), "f").value == 'f');
    REQUIRE(*RunOn(DigitCharacter(16), "F").value == 'F');
    REQUIRE(RunOn(DigitCharacter(16), "g").Failed());
    REQUIRE(RunOn(DigitCharacter(2), "2").Failed());
    REQUIRE(*RunOn(DigitCharacter(36), "z").value == 'z');
}

TEST_CASE("DigitCharacter rejects unsupported bases", "[parsing][text]")
{
    REQUIRE_THROWS_AS(DigitCharacter(1), std::invalid_argument);
    REQUIRE_THROWS_AS(DigitCharacter(37), std::invalid_argument);
}

TEST_CASE("Space accepts whitespace characters", "[parsing][text]")
{
    for (const std::string_view input : {" ", "\t", "\n", "\r"})
        REQUIRE(RunOn(Space(), input).Succeeded());
    REQUIRE(RunOn(Space(), "x").Failed());
}

TEST_CASE("Spaces collapses a whitespace run into one space", "[parsing][text]")
{
    const auto result = RunOn(Spaces(), " \t\r\n  x");
    REQUIRE(*result.value == ' ');
    REQUIRE(result.state.remaining == "x");
    REQUIRE(result.state.position.Line() == 2);
    REQUIRE(result.state.position.Column() == 3);

    REQUIRE(RunOn(Spaces(), "x").Failed());
}

TEST_CASE("Text collects repeated characters", "[parsing][text]")
{
    const auto result = RunOn(Text(Character('a')), "aaaab");
    REQUIRE(*result.value == "aaaa");
    REQUIRE(result.state.remaining == "b");

    REQUIRE(RunOn(Text(Character('a')), "b").Failed());
}

TEST_CASE("Text without a parser consumes the rest of the input", "[parsing][text]")
{
    REQUIRE(*RunOn(Text(), "abcde").value == "abcde");
    REQUIRE(RunOn(Text(), "").Failed());
}

TEST_CASE("Text concatenates string pieces", "[parsing][text]")
{
    const auto result = RunOn(Text(Or(String("ab"), String("c"))), "abcab!");
    REQUIRE(*result.value == "abcab");
    REQUIRE(result.state.remaining == "!");
}

TEST_CASE("StringOf joins a list of strings", "[parsing][text]")
{
    const auto words  = Value(std::vector<std::string> {"foo", "", "bar"});
    const auto result = RunOn(StringOf(words), "");
    REQUIRE(*result.value == "foobar");

    const auto letters = Value(std::vector<Char> {'x', 'y'});
    REQUIRE(*RunOn(StringOf(letters), "").value == "xy");
}
