#pragma once

#include <PARC/Primitives.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace PARC::Parsing
{
    /// @brief Line/column location of the parse cursor, with an optional source name.
    ///
    /// Positions are values: `Advance` returns the position after one more input unit and
    /// leaves the receiver untouched. The source name is shared between all positions derived
    /// from the same origin, so advancing never copies it.
    class SourcePosition
    {
    public:
        SourcePosition() noexcept = default;

        explicit SourcePosition(std::string name, UInt32 line = 1, UInt32 column = 1)
            : m_line(line), m_column(column)
        {
            if (!name.empty())
                m_name = std::make_shared<std::string>(std::move(name));
        }

        [[nodiscard]] bool HasName() const noexcept { return m_name != nullptr; }

        [[nodiscard]] std::string_view Name() const noexcept
        {
            if (!m_name)
                return {};
            return *m_name;
        }

        /// @brief 1-based line number.
        [[nodiscard]] UInt32 Line() const noexcept { return m_line; }

        /// @brief 1-based column number.
        [[nodiscard]] UInt32 Column() const noexcept { return m_column; }

        /// @brief Returns the position after consuming `unit`.
        ///
        /// A newline moves to column 1 of the next line; any other unit moves one column right.
        [[nodiscard]] SourcePosition Advance(Char unit) const noexcept
        {
            SourcePosition next {*this};
            if (unit == '\n')
            {
                ++next.m_line;
                next.m_column = 1;
            }
            else
            {
                ++next.m_column;
            }
            return next;
        }

        [[nodiscard]] bool operator==(const SourcePosition& other) const noexcept
        {
            return m_line == other.m_line && m_column == other.m_column && Name() == other.Name();
        }

    private:
        std::shared_ptr<const std::string> m_name {};
        UInt32                             m_line {1};
        UInt32                             m_column {1};
    };
}// namespace PARC::Parsing
