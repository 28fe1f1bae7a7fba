/// @file NumberParsers.hpp
/// @brief Digit and integer parsers.
#pragma once

#include <PARC/Defines.hpp>
#include <PARC/Parsing/Parser.hpp>

namespace PARC::Parsing
{
    /// @brief Consumes one token and yields its digit value in `base`.
    ///
    /// Fails with "invalid digit" when the token is not a digit of `base`.
    /// @throws std::invalid_argument if `base` is outside 2 to 36.
    [[nodiscard]] PARC_API Parser<Int32> Digit(UInt32 base = 10);

    /// @brief One or more digits of `base`, without a sign.
    ///
    /// Fails with "number out of range" when the value does not fit in `Int64`.
    [[nodiscard]] PARC_API Parser<Int64> NaturalNumber(UInt32 base = 10);

    /// @brief A natural number with an optional leading `+` or `-`.
    ///
    /// Accepts the whole `Int64` range, including its lowest value; anything beyond fails
    /// with "number out of range".
    [[nodiscard]] PARC_API Parser<Int64> Integer(UInt32 base = 10);
}// namespace PARC::Parsing
