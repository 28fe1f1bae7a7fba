#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Parsing/SourcePosition.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PARC::Parsing
{
    /// @brief Classification tags used by the built-in parsers.
    ///
    /// The set is open: `Fail` accepts any tag.
    namespace ErrorTypes
    {
        inline constexpr std::string_view Failure     = "failure";
        inline constexpr std::string_view Eof         = "eof";
        inline constexpr std::string_view Expectation = "expectation";
    }// namespace ErrorTypes

    /// @brief Parse failure with accumulated messages, a position and a type tag.
    struct PARC_API ParseError
    {
        SourcePosition           position {};
        std::vector<std::string> messages {};
        std::string              type {ErrorTypes::Failure};

        /// @brief An error without messages counts as "no error" when merging.
        [[nodiscard]] bool IsEmpty() const noexcept { return messages.empty(); }

        /// @brief Renders `name:line:column: type: message; message`.
        [[nodiscard]] std::string ToString() const;
    };

    /// @brief Merges two errors.
    ///
    /// An empty side yields the other one. Otherwise the messages are concatenated
    /// (`existing` first) and the result takes the position and type of `incoming`.
    [[nodiscard]] PARC_API ParseError MergeErrors(const ParseError& existing, const ParseError& incoming);

    /// @brief Merges two optional errors; an absent side yields the other one.
    [[nodiscard]] PARC_API std::optional<ParseError> MergeErrors(const std::optional<ParseError>& existing,
                                                                 const std::optional<ParseError>& incoming);

    template<typename T>
    using ParseExpected = std::expected<T, ParseError>;
}// namespace PARC::Parsing
