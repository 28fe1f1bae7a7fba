/// @file Trace.hpp
/// @brief Diagnostic tracing of parser execution.
#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Parsing/Parser.hpp>

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace PARC::Parsing
{
    enum class TraceEventKind : UInt8
    {
        Enter,
        Success,
        Failure,
    };

    /// @brief One observation reported by a traced parser.
    ///
    /// `error` is only set for `Failure` events and is valid for the duration of the callback.
    struct TraceEvent
    {
        std::string_view  label {};
        TraceEventKind    kind {TraceEventKind::Enter};
        SourcePosition    position {};
        UIntSize          remaining {0};
        const ParseError* error {nullptr};
    };

    using TraceSink = std::function<void(const TraceEvent&)>;

    [[nodiscard]] PARC_API std::string_view ToString(TraceEventKind kind) noexcept;

    /// @brief Renders `[label] kind at line:column (N remaining)`, followed by the error for failures.
    [[nodiscard]] PARC_API std::string FormatTraceEvent(const TraceEvent& event);

    /// @brief Sink writing one formatted line per event to `stream`.
    ///
    /// The stream must outlive every parser using the sink.
    [[nodiscard]] PARC_API TraceSink MakeStreamTraceSink(std::ostream& stream);

    /// @brief Reports entry and outcome of `parser` to `sink`.
    ///
    /// The wrapped parser's result is returned unchanged. An empty sink disables reporting.
    template<typename T>
    [[nodiscard]] Parser<T> Trace(std::string label, Parser<T> parser, TraceSink sink)
    {
        if (!sink)
            return parser;

        return Parser<T>([label = std::move(label), parser = std::move(parser), sink = std::move(sink)](const ParseState& state) {
            sink(TraceEvent {label, TraceEventKind::Enter, state.position, state.remaining.size(), nullptr});
            ParseResult<T> result = parser.Run(state);
            if (result.Failed())
                sink(TraceEvent {label, TraceEventKind::Failure, result.state.position, result.state.remaining.size(), &*result.state.error});
            else
                sink(TraceEvent {label, TraceEventKind::Success, result.state.position, result.state.remaining.size(), nullptr});
            return result;
        });
    }
}// namespace PARC::Parsing
