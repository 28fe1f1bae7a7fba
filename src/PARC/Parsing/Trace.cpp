#include <PARC/Parsing/Trace.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>

namespace PARC::Parsing
{
    std::string_view ToString(TraceEventKind kind) noexcept
    {
        switch (kind)
        {
            case TraceEventKind::Enter: return "enter";
            case TraceEventKind::Success: return "success";
            case TraceEventKind::Failure: return "failure";
        }
        Unreachable();
    }

    std::string FormatTraceEvent(const TraceEvent& event)
    {
        auto line = fmt::format("[{}] {} at {}:{} ({} remaining)",
                                event.label,
                                ToString(event.kind),
                                event.position.Line(),
                                event.position.Column(),
                                event.remaining);
        if (event.kind == TraceEventKind::Failure && event.error != nullptr)
            line += fmt::format(": {}", event.error->ToString());
        return line;
    }

    TraceSink MakeStreamTraceSink(std::ostream& stream)
    {
        return [&stream](const TraceEvent& event) {
            fmt::print(stream, "{}\n", FormatTraceEvent(event));
        };
    }
}// namespace PARC::Parsing
