#include <PARC/Parsing/Combinators.hpp>
#include <PARC/Parsing/Parse.hpp>
#include <PARC/Parsing/TextParsers.hpp>
#include <PARC/Parsing/Trace.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace PARC;
using namespace PARC::Parsing;

namespace
{
    struct RecordedEvent
    {
        std::string    label;
        TraceEventKind kind;
        UIntSize       remaining;
        std::string    error;
    };

    TraceSink Recorder(std::vector<RecordedEvent>& events)
    {
        return [&events](const TraceEvent& event) {
            events.push_back({std::string {event.label},
                              event.kind,
                              event.remaining,
                              event.error != nullptr ? event.error->ToString() : std::string {}});
        };
    }

    template<typename T>
    ParseResult<T> RunOn(const Parser<T>& parser, std::string_view input)
    {
        return parser.Run(MakeInitialState(input));
    }
}// namespace

TEST_CASE("Trace reports entry and success", "[parsing][trace]")
{
    std::vector<RecordedEvent> events;
    const auto                 parser = Trace("word", String("ab"), Recorder(events));

    const auto result = RunOn(parser, "abc");
    REQUIRE(*result.value == "ab");
    REQUIRE(result.state.remaining == "c");

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].label == "word");
    REQUIRE(events[0].kind == TraceEventKind::Enter);
    REQUIRE(events[0].remaining == 3);
    REQUIRE(events[1].kind == TraceEventKind::Success);
    REQUIRE(events[1].remaining == 1);
    REQUIRE(events[1].error.empty());
}

TEST_CASE("Trace reports failures with their error", "[parsing][trace]")
{
    std::vector<RecordedEvent> events;
    const auto                 parser = Trace("digit", Character('1'), Recorder(events));

    const auto result = RunOn(parser, "");
    REQUIRE(result.Failed());
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].kind == TraceEventKind::Failure);
    REQUIRE(events[1].error == "1:1: eof: unexpected eof");
}

TEST_CASE("Nested traces report in execution order", "[parsing][trace]")
{
    std::vector<RecordedEvent> events;
    const auto                 sink  = Recorder(events);
    const auto                 inner = Trace("inner", Token(), sink);
    const auto                 outer = Trace("outer", OneOrMore(inner), sink);

    REQUIRE(RunOn(outer, "x").Succeeded());

    std::vector<std::string> order;
    for (const auto& event : events)
        order.push_back(event.label + ":" + std::string {ToString(event.kind)});
    REQUIRE(order == std::vector<std::string> {"outer:enter", "inner:enter", "inner:success", "inner:enter", "inner:failure", "outer:success"});
}

TEST_CASE("Trace without a sink leaves the parser untouched", "[parsing][trace]")
{
    const auto parser = Trace("quiet", Token(), TraceSink {});
    REQUIRE(*RunOn(parser, "q").value == 'q');
}

TEST_CASE("FormatTraceEvent renders one line per event", "[parsing][trace]")
{
    const TraceEvent enter {"value", TraceEventKind::Enter, SourcePosition {{}, 2, 5}, 12, nullptr};
    REQUIRE(FormatTraceEvent(enter) == "[value] enter at 2:5 (12 remaining)");

    const ParseError error {SourcePosition {{}, 2, 6}, {"invalid digit"}, "failure"};
    const TraceEvent failure {"value", TraceEventKind::Failure, SourcePosition {{}, 2, 6}, 11, &error};
    REQUIRE(FormatTraceEvent(failure) == "[value] failure at 2:6 (11 remaining): 2:6: failure: invalid digit");
}

TEST_CASE("Stream sink writes formatted events", "[parsing][trace]")
{
    std::ostringstream stream;
    const auto         parser = Trace("token", Token(), MakeStreamTraceSink(stream));

    REQUIRE(*Parse(parser, "a") == 'a');
    REQUIRE(stream.str() == "[token] enter at 1:1 (1 remaining)\n[token] success at 1:2 (0 remaining)\n");
}
