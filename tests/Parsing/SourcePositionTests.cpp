#include <PARC/Parsing/SourcePosition.hpp>

#include <catch2/catch_test_macros.hpp>

using PARC::Parsing::SourcePosition;

TEST_CASE("SourcePosition starts at line 1, column 1", "[parsing][position]")
{
    const SourcePosition position;
    REQUIRE(position.Line() == 1);
    REQUIRE(position.Column() == 1);
    REQUIRE_FALSE(position.HasName());
    REQUIRE(position.Name().empty());
}

TEST_CASE("SourcePosition advances column for ordinary units", "[parsing][position]")
{
    const SourcePosition start;
    const SourcePosition next = start.Advance('a').Advance('\t');

    REQUIRE(next.Line() == 1);
    REQUIRE(next.Column() == 3);
    // Advancing returns a new value.
    REQUIRE(start.Column() == 1);
}

TEST_CASE("SourcePosition moves to the next line on newline", "[parsing][position]")
{
    const SourcePosition position = SourcePosition {}.Advance('a').Advance('b').Advance('\n');
    REQUIRE(position.Line() == 2);
    REQUIRE(position.Column() == 1);

    const SourcePosition after = position.Advance('c');
    REQUIRE(after.Line() == 2);
    REQUIRE(after.Column() == 2);
}

TEST_CASE("SourcePosition keeps its source name while advancing", "[parsing][position]")
{
    const SourcePosition named {"grammar.txt"};
    const SourcePosition moved = named.Advance('x').Advance('\n');

    REQUIRE(moved.HasName());
    REQUIRE(moved.Name() == "grammar.txt");
    REQUIRE(moved == SourcePosition {"grammar.txt", 2, 1});
    REQUIRE_FALSE(moved == SourcePosition {"other.txt", 2, 1});
}
