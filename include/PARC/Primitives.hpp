// Fundamental type definitions shared by every PARC module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace PARC
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit signed integer.
    using Int64 = std::int64_t;
    /// @brief Represents a 32-bit signed integer.
    using Int32 = std::int32_t;

    using UIntSize = std::size_t;

    /// @brief Represents one unit of parser input.
    using Char = char;
}// namespace PARC
