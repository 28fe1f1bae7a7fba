#pragma once

#include <PARC/Primitives.hpp>

#include <stdexcept>
#include <string>

namespace PARC::Parsing::detail
{
    inline constexpr UInt32 kMinBase = 2;
    inline constexpr UInt32 kMaxBase = 36;

    /// @brief Value of `unit` as a base-36 digit, or `kMaxBase` if it is not one.
    [[nodiscard]] constexpr UInt32 DigitValue(Char unit) noexcept
    {
        if (unit >= '0' && unit <= '9')
            return static_cast<UInt32>(unit - '0');
        if (unit >= 'a' && unit <= 'z')
            return static_cast<UInt32>(unit - 'a' + 10);
        if (unit >= 'A' && unit <= 'Z')
            return static_cast<UInt32>(unit - 'A' + 10);
        return kMaxBase;
    }

    inline void ValidateBase(UInt32 base)
    {
        if (base < kMinBase || base > kMaxBase)
            throw std::invalid_argument("numeric base must be between 2 and 36, got " + std::to_string(base));
    }
}// namespace PARC::Parsing::detail
