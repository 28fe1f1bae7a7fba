#include <PARC/Parsing/ParseError.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace PARC::Parsing
{
    std::string ParseError::ToString() const
    {
        const auto location = position.HasName()
                                      ? fmt::format("{}:{}:{}", position.Name(), position.Line(), position.Column())
                                      : fmt::format("{}:{}", position.Line(), position.Column());
        return fmt::format("{}: {}: {}", location, type, fmt::join(messages, "; "));
    }

    ParseError MergeErrors(const ParseError& existing, const ParseError& incoming)
    {
        if (existing.IsEmpty())
            return incoming;
        if (incoming.IsEmpty())
            return existing;

        ParseError merged;
        merged.position = incoming.position;
        merged.type     = incoming.type;
        merged.messages.reserve(existing.messages.size() + incoming.messages.size());
        merged.messages.insert(merged.messages.end(), existing.messages.begin(), existing.messages.end());
        merged.messages.insert(merged.messages.end(), incoming.messages.begin(), incoming.messages.end());
        return merged;
    }

    std::optional<ParseError> MergeErrors(const std::optional<ParseError>& existing,
                                          const std::optional<ParseError>& incoming)
    {
        if (!existing)
            return incoming;
        if (!incoming)
            return existing;
        return MergeErrors(*existing, *incoming);
    }
}// namespace PARC::Parsing
